#include "versioncheck.h"

#include <torch/version.h>

#include <algorithm>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>

std::ostream& operator<<(std::ostream& out, const Version& version) {
  out << version.major << "." << version.minor << "." << version.patch;
  return out;
}

Version ParseVersion(const std::string& version) {
  // build suffixes like "-rc1" or "+cu117"
  auto release = version.substr(0, version.find_first_of("-+"));

  static const std::regex version_re(R"(^(\d+)(?:\.(\d+))?(?:\.(\d+))?$)");
  std::smatch match;
  if (!std::regex_match(release, match, version_re))
    throw std::invalid_argument("Wrong version string : " + version);

  Version result;
  try {
    result.major = std::stoi(match[1].str());
    if (match[2].matched)
      result.minor = std::stoi(match[2].str());
    if (match[3].matched)
      result.patch = std::stoi(match[3].str());
  } catch (const std::out_of_range&) {
    throw std::invalid_argument("Version number is too large : " + version);
  }
  return result;
}

Version TorchVersion() {
  return Version{TORCH_VERSION_MAJOR, TORCH_VERSION_MINOR, TORCH_VERSION_PATCH};
}

bool VersionOk(const Version& version,
               const Version& minimum,
               const std::vector<Version>& blacklisted) {
  if (version < minimum)
    return false;
  return std::find(blacklisted.begin(), blacklisted.end(), version) ==
         blacklisted.end();
}

void AssertVersion(const Version& version,
                   const Version& minimum,
                   const std::vector<Version>& blacklisted) {
  if (VersionOk(version, minimum, blacklisted))
    return;

  std::stringstream msg;
  msg << "You are using libtorch version " << version
      << ". The minimum required version is " << minimum << " (blacklisted: [";
  for (size_t i = 0; i < blacklisted.size(); ++i) {
    if (i > 0)
      msg << ", ";
    msg << blacklisted[i];
  }
  msg << "]).";
  throw std::runtime_error(msg.str());
}

void AssertTorchVersion(const Version& minimum,
                        const std::vector<Version>& blacklisted) {
  AssertVersion(TorchVersion(), minimum, blacklisted);
}

bool CheckTorchVersion() {
  try {
    AssertTorchVersion();
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    return false;
  }
  return true;
}
