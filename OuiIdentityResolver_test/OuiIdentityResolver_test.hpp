#if !defined OUI_IDENTITY_RESOLVER_TEST_HPP
#define OUI_IDENTITY_RESOLVER_TEST_HPP

#include "TestCases.hpp"
#include "TestMacros.hpp"

TEST_CASES_BEGIN(OuiIdentityResolver_test)

    TEST(KnownPrefix);
    TEST(UnknownPrefix);
    TEST(HostnameKeyword);
    TEST(MostSpecificMatch);
    TEST(ManufacturerFallback);

TEST_CASES_END(OuiIdentityResolver_test)

#endif
