#include "IdentityResolver.hpp"

const char* const IdentityResolver::UNKNOWN_DEVICE_TYPE = "Unknown Device";

//=============================================================================================
IdentityResolver::~IdentityResolver()
{
}
