#include "version.hpp"

namespace tapvault {

const char *const Version::core_version = TAPVAULT_VERSION;
const char *const Version::node_version = TAPVAULT_NODE_VERSION;
const char *const Version::secp256k1_version = TAPVAULT_SECP256K1_VERSION;

}
