#include "version_diff.hpp"

#include <algorithm>
#include <bitset>
#include <string>

namespace artifact::versioning {

namespace {

// segments separated by '\n'; an empty content is one empty line
uint64_t CountLines(const std::string& content) {
  return static_cast<uint64_t>(std::count(content.begin(), content.end(), '\n')) + 1;
}

std::bitset<256> CharSet(const std::string& content) {
  std::bitset<256> set;
  for (unsigned char c : content) {
    set.set(c);
  }
  return set;
}

} // namespace

artifact::manager::v1::VersionComparison CompareVersions(const artifact::manager::v1::ArtifactVersion& a,
                                                         const artifact::manager::v1::ArtifactVersion& b) {
  artifact::manager::v1::VersionComparison out;
  out.set_artifact_id(a.artifact_id());
  out.set_version_a(a.version());
  out.set_version_b(b.version());

  const auto size_a  = static_cast<uint64_t>(a.content().size());
  const auto size_b  = static_cast<uint64_t>(b.content().size());
  const auto lines_a = CountLines(a.content());
  const auto lines_b = CountLines(b.content());

  out.set_size_a(size_a);
  out.set_size_b(size_b);
  out.set_size_diff(static_cast<int64_t>(size_b) - static_cast<int64_t>(size_a));
  out.set_lines_a(lines_a);
  out.set_lines_b(lines_b);
  out.set_lines_diff(static_cast<int64_t>(lines_b) - static_cast<int64_t>(lines_a));

  const auto set_a       = CharSet(a.content());
  const auto set_b       = CharSet(b.content());
  const auto unions      = (set_a | set_b).count();
  const auto intersected = (set_a & set_b).count();
  out.set_similarity(unions == 0 ? 1.0 : static_cast<double>(intersected) / static_cast<double>(unions));
  out.set_identical(a.content() == b.content());
  return out;
}

} // namespace artifact::versioning
