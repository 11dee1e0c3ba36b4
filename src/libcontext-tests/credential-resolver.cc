#include "awsctx/context/credential-resolver.hh"
#include "awsctx/context/globals.hh"
#include "awsctx/context/tests/capturing-logger.hh"
#include "awsctx/context/tests/mocks.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace awsctx {

using namespace awsctx::testing;
using ::testing::_;
using ::testing::Invoke;
using ::testing::StrictMock;

class CredentialResolverTest : public WithCapturingLogger
{
protected:
    AwsCredentials creds{"AKIDEXAMPLE", "wJalrXUtnFEMI", "token"};
    AwsCredentials otherCreds{"AKIDOTHER", "secret"};

    ref<StrictMock<MockCredentialResolver>> first = make_ref<StrictMock<MockCredentialResolver>>("first");
    ref<StrictMock<MockCredentialResolver>> second = make_ref<StrictMock<MockCredentialResolver>>("second");
};

TEST_F(CredentialResolverTest, chainStopsAtFirstCredentials)
{
    CredentialResolverChain chain({first, second});

    EXPECT_CALL(*first, resolve("default", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(creds)));

    ASSERT_EQ(chain.resolve("default"), creds);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "using credentials from first for profile 'default'"));
}

TEST_F(CredentialResolverTest, chainSkipsEmptyResults)
{
    CredentialResolverChain chain({first, second});

    ::testing::InSequence seq;
    EXPECT_CALL(*first, resolve("default", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(std::nullopt)));
    EXPECT_CALL(*second, resolve("default", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(otherCreds)));

    ASSERT_EQ(chain.resolve("default"), otherCreds);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "first has no credentials for profile 'default'"));
}

TEST_F(CredentialResolverTest, chainSkipsFailures)
{
    CredentialResolverChain chain({first, second});

    ::testing::InSequence seq;
    EXPECT_CALL(*first, resolve("default", _))
        .WillOnce(Invoke(failWith<std::optional<AwsCredentials>>(std::runtime_error("connection refused"))));
    EXPECT_CALL(*second, resolve("default", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(creds)));

    ASSERT_EQ(chain.resolve("default"), creds);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "connection refused"));
}

TEST_F(CredentialResolverTest, exhaustedChainReportsNothing)
{
    CredentialResolverChain chain({first, second});

    EXPECT_CALL(*first, resolve("default", _))
        .WillOnce(Invoke(failWith<std::optional<AwsCredentials>>(AwsAuthError("profile not found"))));
    EXPECT_CALL(*second, resolve("default", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(std::nullopt)));

    ASSERT_EQ(chain.resolve("default"), std::nullopt);
}

TEST_F(CredentialResolverTest, emptyChainReportsNothing)
{
    CredentialResolverChain chain(CredentialResolvers{});

    ASSERT_EQ(chain.resolve("default"), std::nullopt);
}

TEST_F(CredentialResolverTest, chainReportsThroughCallback)
{
    CredentialResolverChain chain({first});

    EXPECT_CALL(*first, resolve("default", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(creds)));

    int calls = 0;
    chain.resolve("default", {[&](std::future<std::optional<AwsCredentials>> result) {
                      calls++;
                      ASSERT_EQ(result.get(), creds);
                  }});

    ASSERT_EQ(calls, 1);
}

TEST_F(CredentialResolverTest, constructorErrorMeansNoCredentials)
{
    ConstructorResolver resolver("shared file", [](const std::string & profileName) -> AwsCredentials {
        throw AwsAuthError("profile '%s' not found", profileName);
    });

    ASSERT_EQ(resolver.resolve("missing"), std::nullopt);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "shared file credentials unavailable for profile 'missing'"));
}

TEST_F(CredentialResolverTest, constructorResultIsReported)
{
    ConstructorResolver resolver("process", [&](const std::string & profileName) {
        EXPECT_EQ(profileName, "proc");
        return creds;
    });

    ASSERT_EQ(resolver.resolve("proc"), creds);
}

TEST_F(CredentialResolverTest, constructorForeignExceptionMeansNoCredentials)
{
    ConstructorResolver resolver(
        "process", [](const std::string &) -> AwsCredentials { throw std::runtime_error("unexpected failure"); });

    ASSERT_EQ(resolver.resolve("proc"), std::nullopt);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "unexpected failure"));
}

TEST_F(CredentialResolverTest, constructorNonStandardExceptionMeansNoCredentials)
{
    ConstructorResolver resolver("process", [](const std::string &) -> AwsCredentials { throw 42; });

    CredentialResolverChain chain(CredentialResolvers{make_ref<ConstructorResolver>(resolver)});
    ASSERT_EQ(chain.resolve("proc"), std::nullopt);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "process credentials unavailable for profile 'proc'"));
}

TEST_F(CredentialResolverTest, chainSurvivesNonStandardFailure)
{
    CredentialResolverChain chain({first, second});

    EXPECT_CALL(*first, resolve("default", _)).WillOnce(Invoke(failWith<std::optional<AwsCredentials>>(42)));
    EXPECT_CALL(*second, resolve("default", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(creds)));

    ASSERT_EQ(chain.resolve("default"), creds);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "first failed to resolve profile 'default'"));
}

TEST_F(CredentialResolverTest, managerResolverPassesFailuresOn)
{
    auto manager = std::make_shared<StrictMock<MockCredentialsManager>>();
    CredentialsManagerResolver resolver{ref<CredentialsManager>(manager)};

    EXPECT_CALL(*manager, getCredentials("known", _)).WillOnce(Invoke(completeWith<AwsCredentials>(creds)));
    EXPECT_CALL(*manager, getCredentials("unknown", _))
        .WillOnce(Invoke(failWith<AwsCredentials>(AwsAuthError("unknown profile"))));

    ASSERT_EQ(resolver.name, "credentials manager");
    ASSERT_EQ(resolver.resolve("known"), creds);
    ASSERT_THROW(resolver.resolve("unknown"), AwsAuthError);
}

TEST(makeDefaultFallbackResolvers, followsSettings)
{
    ContextSettings settings;

    auto names = [&]() {
        std::vector<std::string> res;
        for (auto & resolver : makeDefaultFallbackResolvers(settings))
            res.push_back(resolver->name);
        return res;
    };

    ASSERT_EQ(names(), std::vector<std::string>({"shared file", "process"}));

    settings.sharedFileCredentials = false;
    ASSERT_EQ(names(), std::vector<std::string>({"process"}));

    settings.processCredentials = false;
    ASSERT_TRUE(names().empty());
}

} // namespace awsctx
