#pragma once

#include "artifact/manager/v1.hpp"

namespace artifact::versioning {

// Size, line and character-set comparison of two versions of one artifact.
// similarity is the Jaccard index of the distinct characters of both
// contents; two empty contents are identical with similarity 1.
artifact::manager::v1::VersionComparison CompareVersions(const artifact::manager::v1::ArtifactVersion& a,
                                                         const artifact::manager::v1::ArtifactVersion& b);

} // namespace artifact::versioning
