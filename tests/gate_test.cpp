#include <gtest/gtest.h>
#include "regauth/auth/gate.hpp"
#include "regauth/security/scopes.hpp"
#include "regauth/storage/token_store.hpp"
#include <cstring>
#include <string>

using namespace regauth::auth;
using namespace regauth::core;
using regauth::db::DbConfig;
using regauth::db::DbHandle;

namespace {

class GateTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(is_ok(regauth::db::db_open(DbConfig{}, &db_)));
    }
    void TearDown() override {
        if (open_) {
            (void)regauth::db::db_close(db_);
        }
    }

    regauth::storage::CreatedToken issue(const regauth::storage::NewTokenParams& params) {
        regauth::storage::CreatedToken created{};
        EXPECT_TRUE(is_ok(regauth::storage::token_store_insert(db_, params, 1000, &created)));
        return created;
    }

    regauth::storage::CreatedToken issue_unscoped(u32 owner, TokenKind kind = TokenKind::Api) {
        regauth::storage::NewTokenParams params{};
        params.owner = UserId{owner};
        params.kind = kind;
        params.name = "gate";
        return issue(params);
    }

    Status auth(const char* presented, EndpointScope endpoint, const char* crate, Principal* out) {
        return authenticate(db_, AuthRequest{presented, endpoint, crate}, 2000, out);
    }

    DbHandle db_{};
    bool open_{true};
};

} // namespace

//=============================================================================
// Error Mapping Tests
//=============================================================================

TEST(AuthErrors, StatusCarriesAuthError) {
    const Status s = make_auth_status(AuthError::InsufficientScope);
    EXPECT_EQ(s.domain, StatusDomain::Auth);
    EXPECT_EQ(s.code, StatusCode::PermissionDenied);
    EXPECT_EQ(auth_error_of(s), AuthError::InsufficientScope);

    EXPECT_TRUE(is_ok(make_auth_status(AuthError::None)));
    EXPECT_EQ(auth_error_of(ok_status()), AuthError::None);
}

TEST(AuthErrors, ForeignStatusIsStoreUnavailable) {
    EXPECT_EQ(auth_error_of(make_status(StatusDomain::Db, StatusCode::Busy)), AuthError::StoreUnavailable);
    EXPECT_EQ(auth_error_of(make_status(StatusDomain::Auth, StatusCode::Invalid, 77)), AuthError::StoreUnavailable);
}

TEST(AuthErrors, PublicFailureCollapsesCredentialErrors) {
    EXPECT_EQ(public_failure(AuthError::MalformedToken), PublicFailure::Unauthenticated);
    EXPECT_EQ(public_failure(AuthError::InvalidOrRevokedToken), PublicFailure::Unauthenticated);
    EXPECT_EQ(public_failure(AuthError::LegacyTokenRejected), PublicFailure::Unauthenticated);
    EXPECT_EQ(public_failure(AuthError::InsufficientScope), PublicFailure::Forbidden);
    EXPECT_EQ(public_failure(AuthError::StoreUnavailable), PublicFailure::Unavailable);
    EXPECT_EQ(public_failure(AuthError::None), PublicFailure::None);
    EXPECT_STREQ(auth_error_name(AuthError::LegacyTokenRejected), "legacy_token_rejected");
}

//=============================================================================
// Authenticate Tests
//=============================================================================

TEST_F(GateTest, ScopedTokenEndToEnd) {
    regauth::storage::NewTokenParams params{};
    params.owner = UserId{17};
    params.name = "release";
    regauth::security::crate_scopes_restrict(&params.crate_scopes);
    ASSERT_TRUE(is_ok(regauth::security::crate_scopes_add(&params.crate_scopes, "foo")));
    regauth::security::endpoint_scopes_restrict(&params.endpoint_scopes);
    ASSERT_TRUE(is_ok(regauth::security::endpoint_scopes_add(&params.endpoint_scopes, EndpointScope::Publish)));
    regauth::storage::CreatedToken created = issue(params);

    Principal p{};
    ASSERT_TRUE(is_ok(auth(created.plaintext, EndpointScope::Publish, "foo", &p)));
    EXPECT_EQ(p.owner, UserId{17});
    EXPECT_EQ(p.token, created.model.id);
    EXPECT_EQ(p.kind, TokenKind::Api);
    EXPECT_TRUE(p.usage_recorded);
    EXPECT_TRUE(p.crate_scopes.restricted);

    EXPECT_EQ(auth_error_of(auth(created.plaintext, EndpointScope::Publish, "bar", &p)),
              AuthError::InsufficientScope);
    EXPECT_EQ(auth_error_of(auth(created.plaintext, EndpointScope::Yank, "foo", &p)),
              AuthError::InsufficientScope);

    ASSERT_TRUE(is_ok(regauth::storage::token_store_revoke(db_, created.model.id)));
    EXPECT_EQ(auth_error_of(auth(created.plaintext, EndpointScope::Publish, "foo", &p)),
              AuthError::InvalidOrRevokedToken);
}

TEST_F(GateTest, SuccessRecordsLastUsed) {
    regauth::storage::CreatedToken created = issue_unscoped(1);
    Principal p{};
    ASSERT_TRUE(is_ok(auth(created.plaintext, EndpointScope::Publish, "anything", &p)));

    ApiToken stored{};
    ASSERT_TRUE(is_ok(regauth::storage::token_store_get(db_, created.model.id, &stored)));
    EXPECT_TRUE(stored.has_last_used);
    EXPECT_EQ(stored.last_used_at, 2000);
}

TEST_F(GateTest, UnknownAndRevokedLookIdentical) {
    regauth::storage::CreatedToken revoked = issue_unscoped(1);
    ASSERT_TRUE(is_ok(regauth::storage::token_store_revoke(db_, revoked.model.id)));

    // Well formed, never issued.
    std::string never(revoked.plaintext);
    never[3] = never[3] == 'a' ? 'b' : 'a';

    Principal p{};
    const Status a = auth(revoked.plaintext, EndpointScope::Publish, "foo", &p);
    const Status b = auth(never.c_str(), EndpointScope::Publish, "foo", &p);
    EXPECT_EQ(a.code, b.code);
    EXPECT_EQ(a.domain, b.domain);
    EXPECT_EQ(a.aux, b.aux);
    EXPECT_EQ(auth_error_of(a), AuthError::InvalidOrRevokedToken);
    EXPECT_EQ(public_failure(auth_error_of(a)), public_failure(auth_error_of(b)));
}

TEST_F(GateTest, LegacyTokenRejected) {
    Principal p{};
    const Status s = auth("abcdefghijklmnopqrstuvwxyz012345", EndpointScope::Publish, "foo", &p);
    EXPECT_EQ(auth_error_of(s), AuthError::LegacyTokenRejected);
    EXPECT_EQ(public_failure(auth_error_of(s)), PublicFailure::Unauthenticated);
}

TEST_F(GateTest, MalformedTokens) {
    Principal p{};
    for (const char* bad : {"", "cio", "cio_short", "Bearer cioabc", "cio!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!!"}) {
        EXPECT_EQ(auth_error_of(auth(bad, EndpointScope::Publish, "foo", &p)), AuthError::MalformedToken) << bad;
    }
    EXPECT_EQ(auth_error_of(auth(nullptr, EndpointScope::Publish, "foo", &p)), AuthError::MalformedToken);

    const std::string huge(4096, 'x');
    EXPECT_EQ(auth_error_of(auth(huge.c_str(), EndpointScope::Publish, "foo", &p)), AuthError::MalformedToken);
}

TEST_F(GateTest, ClosedStoreIsUnavailable) {
    regauth::storage::CreatedToken created = issue_unscoped(1);
    ASSERT_TRUE(is_ok(regauth::db::db_close(db_)));
    open_ = false;

    Principal p{};
    const Status s = auth(created.plaintext, EndpointScope::Publish, "foo", &p);
    EXPECT_EQ(auth_error_of(s), AuthError::StoreUnavailable);
    EXPECT_EQ(s.code, StatusCode::Unavailable);
}

TEST_F(GateTest, ReadOnlyStoreStillAuthenticates) {
    regauth::storage::CreatedToken created = issue_unscoped(1);
    ASSERT_TRUE(is_ok(regauth::db::db_set_read_only(db_, true)));

    Principal p{};
    ASSERT_TRUE(is_ok(auth(created.plaintext, EndpointScope::Yank, "foo", &p)));
    EXPECT_FALSE(p.usage_recorded);

    ASSERT_TRUE(is_ok(regauth::db::db_set_read_only(db_, false)));
    ApiToken stored{};
    ASSERT_TRUE(is_ok(regauth::storage::token_store_get(db_, created.model.id, &stored)));
    EXPECT_FALSE(stored.has_last_used);
}

TEST_F(GateTest, RequestWithoutCrateSkipsCrateScopes) {
    regauth::storage::NewTokenParams params{};
    params.owner = UserId{2};
    params.name = "owners";
    regauth::security::crate_scopes_restrict(&params.crate_scopes);
    ASSERT_TRUE(is_ok(regauth::security::crate_scopes_add(&params.crate_scopes, "foo")));
    regauth::storage::CreatedToken created = issue(params);

    Principal p{};
    EXPECT_TRUE(is_ok(auth(created.plaintext, EndpointScope::ChangeOwners, nullptr, &p)));
}

TEST_F(GateTest, UncategorizedRequestNeedsLegacyEndpointScope) {
    regauth::storage::CreatedToken legacy = issue_unscoped(1);

    regauth::storage::NewTokenParams params{};
    params.owner = UserId{1};
    params.name = "restricted";
    regauth::security::endpoint_scopes_restrict(&params.endpoint_scopes);
    ASSERT_TRUE(is_ok(regauth::security::endpoint_scopes_add(&params.endpoint_scopes, EndpointScope::Publish)));
    regauth::storage::CreatedToken restricted = issue(params);

    Principal p{};
    EXPECT_TRUE(is_ok(auth(legacy.plaintext, EndpointScope::None, nullptr, &p)));
    EXPECT_EQ(auth_error_of(auth(restricted.plaintext, EndpointScope::None, nullptr, &p)),
              AuthError::InsufficientScope);
}

TEST_F(GateTest, TrustedPublishTokenAuthenticates) {
    regauth::storage::CreatedToken created = issue_unscoped(5, TokenKind::TrustedPublish);
    Principal p{};
    ASSERT_TRUE(is_ok(auth(created.plaintext, EndpointScope::Publish, "foo", &p)));
    EXPECT_EQ(p.kind, TokenKind::TrustedPublish);
    EXPECT_EQ(p.owner, UserId{5});
}

TEST_F(GateTest, SecretUnderAnotherKindPrefixIsRejected) {
    regauth::storage::CreatedToken api = issue_unscoped(1, TokenKind::Api);
    regauth::storage::CreatedToken tp = issue_unscoped(2, TokenKind::TrustedPublish);

    // Same secret, other kind's prefix.
    const std::string api_as_tp = std::string("cio_tp_") + (api.plaintext + 3);
    const std::string tp_as_api = std::string("cio") + (tp.plaintext + 7);

    Principal p{};
    const Status a = auth(api_as_tp.c_str(), EndpointScope::Publish, "foo", &p);
    EXPECT_FALSE(is_ok(a));
    EXPECT_EQ(auth_error_of(a), AuthError::InvalidOrRevokedToken);

    const Status b = auth(tp_as_api.c_str(), EndpointScope::Publish, "foo", &p);
    EXPECT_FALSE(is_ok(b));
    EXPECT_EQ(auth_error_of(b), AuthError::InvalidOrRevokedToken);

    // The untouched originals still work.
    EXPECT_TRUE(is_ok(auth(api.plaintext, EndpointScope::Publish, "foo", &p)));
    EXPECT_EQ(p.kind, TokenKind::Api);
    EXPECT_TRUE(is_ok(auth(tp.plaintext, EndpointScope::Publish, "foo", &p)));
    EXPECT_EQ(p.kind, TokenKind::TrustedPublish);
}

TEST_F(GateTest, NullPrincipalIsArgumentError) {
    regauth::storage::CreatedToken created = issue_unscoped(1);
    const Status s = authenticate(db_, AuthRequest{created.plaintext, EndpointScope::Publish, "foo"}, 10, nullptr);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(s.domain, StatusDomain::Core);
}

//=============================================================================
// Bearer Header Tests
//=============================================================================

TEST(BearerExtract, StripsScheme) {
    char out[128];
    ASSERT_TRUE(is_ok(bearer_extract("Bearer cioabc", out, sizeof(out))));
    EXPECT_STREQ(out, "cioabc");

    ASSERT_TRUE(is_ok(bearer_extract("Bearer    cioabc", out, sizeof(out))));
    EXPECT_STREQ(out, "cioabc");

    ASSERT_TRUE(is_ok(bearer_extract("cioraw", out, sizeof(out))));
    EXPECT_STREQ(out, "cioraw");
}

TEST(BearerExtract, RejectsEmptyAndOversized) {
    char out[8];
    EXPECT_EQ(bearer_extract("Bearer ", out, sizeof(out)).code, StatusCode::Invalid);
    EXPECT_EQ(bearer_extract("", out, sizeof(out)).code, StatusCode::Invalid);
    EXPECT_EQ(bearer_extract("Bearer 12345678", out, sizeof(out)).code, StatusCode::Invalid);
    EXPECT_EQ(bearer_extract(nullptr, out, sizeof(out)).code, StatusCode::Invalid);
    EXPECT_STREQ(out, "");
}

TEST(BearerExtract, BadHeaderIsMalformedToken) {
    char out[8];
    const Status s = bearer_extract("Bearer ", out, sizeof(out));
    EXPECT_EQ(auth_error_of(s), AuthError::MalformedToken);
    EXPECT_EQ(public_failure(auth_error_of(s)), PublicFailure::Unauthenticated);

    EXPECT_EQ(bearer_extract("cio", nullptr, 0).domain, StatusDomain::Core);
}
