#ifndef VERSIONCHECK_H
#define VERSIONCHECK_H

#include <stdint.h>
#include <iosfwd>
#include <string>
#include <tuple>
#include <vector>

struct Version {
  int32_t major{0};
  int32_t minor{0};
  int32_t patch{0};

  bool operator<(const Version& other) const {
    return std::tie(major, minor, patch) <
           std::tie(other.major, other.minor, other.patch);
  }
  bool operator==(const Version& other) const {
    return std::tie(major, minor, patch) ==
           std::tie(other.major, other.minor, other.patch);
  }
};

std::ostream& operator<<(std::ostream& out, const Version& version);

const Version kMinimumTorchVersion{1, 6, 0};

/*
 * Parses "major.minor.patch", anything after '-' or '+' is ignored,
 * so "1.13.1+cu117" gives {1, 13, 1}. Missing parts are zeros.
 * Throws std::invalid_argument for malformed strings.
 */
Version ParseVersion(const std::string& version);

// Version of the libtorch the program was built with
Version TorchVersion();

bool VersionOk(const Version& version,
               const Version& minimum = kMinimumTorchVersion,
               const std::vector<Version>& blacklisted = {});

/*
 * Throws std::runtime_error describing the detected and required versions
 * if the version is older than minimum or blacklisted.
 */
void AssertVersion(const Version& version,
                   const Version& minimum = kMinimumTorchVersion,
                   const std::vector<Version>& blacklisted = {});

void AssertTorchVersion(const Version& minimum = kMinimumTorchVersion,
                        const std::vector<Version>& blacklisted = {});

/*
 * Prints the error to std::cerr and returns false if libtorch is too old.
 */
bool CheckTorchVersion();

#endif  // VERSIONCHECK_H
