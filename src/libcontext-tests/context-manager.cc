#include "awsctx/context/context-manager.hh"
#include "awsctx/context/globals.hh"
#include "awsctx/context/tests/capturing-logger.hh"
#include "awsctx/context/tests/mocks.hh"
#include "awsctx/context/tests/recording-stores.hh"
#include "awsctx/util/fmt.hh"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <thread>

namespace awsctx {

using namespace awsctx::testing;
using ::testing::_;
using ::testing::Invoke;
using ::testing::StrictMock;

static const std::string region1 = "re-gion-1";
static const std::string region2 = "re-gion-2";
static const std::string profile1 = "profile1";
static const std::string accountId = "123456789012";

class ContextManagerTest : public WithCapturingLogger
{
protected:
    ref<RecordingSettingsStore> settings = make_ref<RecordingSettingsStore>();
    ref<RecordingPersistentState> state = make_ref<RecordingPersistentState>();
    std::shared_ptr<StrictMock<MockCredentialsManager>> credentialsManager =
        std::make_shared<StrictMock<MockCredentialsManager>>();
    ref<StrictMock<MockCredentialResolver>> sharedFile = make_ref<StrictMock<MockCredentialResolver>>("shared file");
    ref<StrictMock<MockCredentialResolver>> process = make_ref<StrictMock<MockCredentialResolver>>("process");

    AwsCredentials creds{"opensesame", "itsasecrettoeverybody"};

    std::vector<ContextChange> changes;
    std::unique_ptr<Subscription> subscription;

    const std::string & profileKey = contextSettings.profileSettingKey.get();
    const std::string & regionsKey = contextSettings.regionsSettingKey.get();
    const std::string & accountIdKey = contextSettings.accountIdStateKey.get();

    std::unique_ptr<ContextManager> makeContext(bool withCredentialsManager = true)
    {
        auto context = std::make_unique<ContextManager>(
            settings,
            state,
            withCredentialsManager ? credentialsManager : nullptr,
            CredentialResolvers{sharedFile, process});
        subscription = context->onDidChangeContext([this](const ContextChange & change) { changes.push_back(change); });
        return context;
    }

    void storeProfile(const std::string & profileName)
    {
        settings->MemorySettingsStore::writeSetting(profileKey, profileName, SettingsScope::Global);
    }

    void storeRegions(const Strings & regions)
    {
        settings->MemorySettingsStore::writeSetting(regionsKey, regions, SettingsScope::Global);
    }
};

/* ----------------------------------------------------------------------------
 * getCredentials
 * --------------------------------------------------------------------------*/

TEST_F(ContextManagerTest, getsCredentialsFromManagerForStoredProfile)
{
    storeProfile(profile1);
    auto context = makeContext();

    EXPECT_CALL(*credentialsManager, getCredentials(profile1, _))
        .WillOnce(Invoke(completeWith<AwsCredentials>(creds)));

    ASSERT_EQ(context->getCredentials(), creds);
}

TEST_F(ContextManagerTest, explicitProfileOverridesStoredProfile)
{
    storeProfile("asdf");
    auto context = makeContext();

    EXPECT_CALL(*credentialsManager, getCredentials(profile1, _))
        .WillOnce(Invoke(completeWith<AwsCredentials>(creds)));

    ASSERT_EQ(context->getCredentials(profile1), creds);
    ASSERT_EQ(context->getCredentialProfileName(), "asdf");
}

TEST_F(ContextManagerTest, noProfileMeansNoCredentials)
{
    auto context = makeContext();

    ASSERT_EQ(context->getCredentials(), std::nullopt);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "no credential profile"));
}

TEST_F(ContextManagerTest, emptyProfileMeansNoCredentials)
{
    storeProfile("");
    auto context = makeContext();

    ASSERT_EQ(context->getCredentials(), std::nullopt);
}

TEST_F(ContextManagerTest, emptyExplicitProfileFallsBackToStoredProfile)
{
    storeProfile(profile1);
    auto context = makeContext();

    EXPECT_CALL(*credentialsManager, getCredentials(profile1, _))
        .WillOnce(Invoke(completeWith<AwsCredentials>(creds)));

    ASSERT_EQ(context->getCredentials(""), creds);
}

TEST_F(ContextManagerTest, emptyExplicitProfileWithoutStoredProfileMeansNoCredentials)
{
    auto context = makeContext();

    ASSERT_EQ(context->getCredentials(""), std::nullopt);
}

TEST_F(ContextManagerTest, unknownProfileFallsThroughToSharedFile)
{
    auto context = makeContext();

    ::testing::InSequence seq;
    EXPECT_CALL(*credentialsManager, getCredentials("asdf", _))
        .WillOnce(Invoke(failWith<AwsCredentials>(AwsAuthError("unknown profile 'asdf'"))));
    EXPECT_CALL(*sharedFile, resolve("asdf", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(creds)));

    ASSERT_EQ(context->getCredentials("asdf"), creds);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "unknown profile 'asdf'"));
}

TEST_F(ContextManagerTest, fallsThroughToProcessCredentials)
{
    auto context = makeContext(false);

    ::testing::InSequence seq;
    EXPECT_CALL(*sharedFile, resolve("proc-credentials", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(std::nullopt)));
    EXPECT_CALL(*process, resolve("proc-credentials", _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(creds)));

    ASSERT_EQ(context->getCredentials("proc-credentials"), creds);
}

TEST_F(ContextManagerTest, exhaustedChainYieldsNothing)
{
    auto context = makeContext();

    EXPECT_CALL(*credentialsManager, getCredentials(profile1, _))
        .WillOnce(Invoke(failWith<AwsCredentials>(AwsAuthError("unknown profile"))));
    EXPECT_CALL(*sharedFile, resolve(profile1, _))
        .WillOnce(Invoke(failWith<std::optional<AwsCredentials>>(AwsAuthError("no such profile"))));
    EXPECT_CALL(*process, resolve(profile1, _))
        .WillOnce(Invoke(failWith<std::optional<AwsCredentials>>(std::runtime_error("process crashed"))));

    std::optional<AwsCredentials> result = creds;
    ASSERT_NO_THROW(result = context->getCredentials(profile1));
    ASSERT_EQ(result, std::nullopt);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "no credentials found for profile 'profile1'"));
}

TEST_F(ContextManagerTest, managerFailureOutsideStdExceptionFallsThrough)
{
    auto context = makeContext();

    ::testing::InSequence seq;
    EXPECT_CALL(*credentialsManager, getCredentials(profile1, _)).WillOnce(Invoke(failWith<AwsCredentials>(42)));
    EXPECT_CALL(*sharedFile, resolve(profile1, _))
        .WillOnce(Invoke(completeWith<std::optional<AwsCredentials>>(std::nullopt)));
    EXPECT_CALL(*process, resolve(profile1, _))
        .WillOnce(Invoke([](const std::string &, Callback<std::optional<AwsCredentials>> callback) {
            try {
                throw "process exited";
            } catch (...) {
                callback.rethrow();
            }
        }));

    std::optional<AwsCredentials> result = creds;
    ASSERT_NO_THROW(result = context->getCredentials(profile1));
    ASSERT_EQ(result, std::nullopt);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "credentials manager failed to resolve profile 'profile1'"));
}

TEST_F(ContextManagerTest, getCredentialsDoesNotChangeStoredProfile)
{
    storeProfile(profile1);
    auto context = makeContext();

    EXPECT_CALL(*credentialsManager, getCredentials("other", _))
        .WillOnce(Invoke(completeWith<AwsCredentials>(creds)));

    context->getCredentials("other");

    ASSERT_EQ(context->getCredentialProfileName(), profile1);
    ASSERT_TRUE(settings->writes().empty());
    ASSERT_TRUE(changes.empty());
}

TEST_F(ContextManagerTest, asyncGetCredentialsReportsThroughCallback)
{
    auto context = makeContext();

    std::optional<std::optional<AwsCredentials>> reported;
    context->getCredentials(std::nullopt, {[&](std::future<std::optional<AwsCredentials>> result) {
                                reported = result.get();
                            }});

    ASSERT_TRUE(reported.has_value());
    ASSERT_EQ(*reported, std::nullopt);
}

TEST_F(ContextManagerTest, defaultFallbacksHonourSettings)
{
    auto savedSharedFile = contextSettings.sharedFileCredentials.get();
    auto savedProcess = contextSettings.processCredentials.get();
    contextSettings.sharedFileCredentials = false;
    contextSettings.processCredentials = false;

    ContextManager context(settings, state);
    auto result = context.getCredentials("ini-credentials");

    contextSettings.sharedFileCredentials = savedSharedFile;
    contextSettings.processCredentials = savedProcess;

    ASSERT_EQ(result, std::nullopt);
}

/* ----------------------------------------------------------------------------
 * profile name
 * --------------------------------------------------------------------------*/

TEST_F(ContextManagerTest, readsProfileOnStartup)
{
    storeProfile(profile1);
    auto context = makeContext();

    ASSERT_EQ(context->getCredentialProfileName(), profile1);
    ASSERT_TRUE(capturedLog->contains(lvlDebug, "stored credential profile is 'profile1'"));
}

TEST_F(ContextManagerTest, setProfileWritesGlobalSettingAndNotifies)
{
    auto context = makeContext();

    context->setCredentialProfileName(profile1);

    ASSERT_EQ(
        settings->writes(),
        std::vector<RecordingSettingsStore::Write>({{profileKey, nlohmann::json(profile1), SettingsScope::Global}}));
    ASSERT_EQ(context->getCredentialProfileName(), profile1);
    ASSERT_EQ(changes.size(), 1u);
    ASSERT_EQ(changes[0].profileName, profile1);
}

TEST_F(ContextManagerTest, clearingProfileRemovesSetting)
{
    storeProfile(profile1);
    auto context = makeContext();

    context->setCredentialProfileName(std::nullopt);

    ASSERT_EQ(context->getCredentialProfileName(), std::nullopt);
    ASSERT_EQ(settings->inspect(profileKey, SettingsScope::Global), std::nullopt);
    ASSERT_EQ(changes.size(), 1u);
    ASSERT_EQ(changes[0].profileName, std::nullopt);
}

TEST_F(ContextManagerTest, malformedProfileIsIgnored)
{
    settings->MemorySettingsStore::writeSetting(profileKey, 42, SettingsScope::Global);
    auto context = makeContext();

    ASSERT_EQ(context->getCredentialProfileName(), std::nullopt);
    ASSERT_EQ(context->getCredentials(), std::nullopt);
    ASSERT_TRUE(capturedLog->contains(lvlWarn, "ignoring setting 'aws.profile'"));
}

/* ----------------------------------------------------------------------------
 * account id
 * --------------------------------------------------------------------------*/

TEST_F(ContextManagerTest, setAccountIdPersistsAndNotifies)
{
    storeProfile(profile1);
    storeRegions({region1});
    auto context = makeContext();

    context->setCredentialAccountId(accountId);

    ASSERT_EQ(context->getCredentialAccountId(), accountId);
    ASSERT_EQ(state->get(accountIdKey), nlohmann::json(accountId));
    ASSERT_EQ(changes, std::vector<ContextChange>({{profile1, accountId, {region1}}}));
}

TEST_F(ContextManagerTest, profileWriteFailureSuppressesNotification)
{
    storeProfile(profile1);
    settings->failWrites = "read-only file system";
    auto context = makeContext();

    try {
        context->setCredentialProfileName("other");
        FAIL() << "expected a SettingsError";
    } catch (SettingsError & e) {
        ASSERT_THAT(e.message(), ::testing::HasSubstr("read-only file system"));
        ASSERT_EQ(e.info().traces.size(), 1u);
    }

    ASSERT_EQ(context->getCredentialProfileName(), profile1);
    ASSERT_TRUE(changes.empty());
}

TEST_F(ContextManagerTest, accountIdFailureSuppressesNotification)
{
    state->failUpdates = "read-only";
    auto context = makeContext();

    ASSERT_THROW(context->setCredentialAccountId(accountId), StateError);
    ASSERT_EQ(context->getCredentialAccountId(), std::nullopt);
    ASSERT_TRUE(changes.empty());
}

/* ----------------------------------------------------------------------------
 * explorer regions
 * --------------------------------------------------------------------------*/

TEST_F(ContextManagerTest, regionsAreEmptyWhenNothingIsStored)
{
    auto context = makeContext();

    ASSERT_EQ(context->getExplorerRegions(), Strings{});
}

TEST_F(ContextManagerTest, readsStoredRegions)
{
    storeRegions({region1, region2});
    auto context = makeContext();

    ASSERT_EQ(context->getExplorerRegions(), Strings({region1, region2}));
}

TEST_F(ContextManagerTest, addSingleRegion)
{
    auto context = makeContext();

    context->addExplorerRegion(region1);

    ASSERT_EQ(context->getExplorerRegions(), Strings({region1}));
    ASSERT_EQ(
        settings->writes(),
        std::vector<RecordingSettingsStore::Write>(
            {{regionsKey, nlohmann::json::array({region1}), SettingsScope::Global}}));
    ASSERT_EQ(changes.size(), 1u);
    ASSERT_EQ(changes[0].regions, Strings({region1}));
}

TEST_F(ContextManagerTest, addMultipleRegionsKeepsOrder)
{
    auto context = makeContext();

    context->addExplorerRegion(region1, region2);

    ASSERT_EQ(context->getExplorerRegions(), Strings({region1, region2}));
    ASSERT_EQ(settings->writes().size(), 1u);
    ASSERT_EQ(changes.size(), 1u);
    ASSERT_EQ(changes[0].regions, Strings({region1, region2}));
}

TEST_F(ContextManagerTest, addAllowsDuplicates)
{
    auto context = makeContext();

    context->addExplorerRegion(region1);
    context->addExplorerRegion(region1);

    ASSERT_EQ(context->getExplorerRegions(), Strings({region1, region1}));
}

TEST_F(ContextManagerTest, removeRegion)
{
    storeRegions({region1, region2});
    auto context = makeContext();

    context->removeExplorerRegion(region2);

    ASSERT_EQ(context->getExplorerRegions(), Strings({region1}));
    ASSERT_EQ(
        settings->writes(),
        std::vector<RecordingSettingsStore::Write>(
            {{regionsKey, nlohmann::json::array({region1}), SettingsScope::Global}}));
    ASSERT_EQ(changes.size(), 1u);
    ASSERT_EQ(changes[0].regions, Strings({region1}));
}

TEST_F(ContextManagerTest, removeDropsEveryOccurrence)
{
    storeRegions({region1, region2, region1, "re-gion-3"});
    auto context = makeContext();

    context->removeExplorerRegions({region1, "re-gion-3"});

    ASSERT_EQ(context->getExplorerRegions(), Strings({region2}));
}

TEST_F(ContextManagerTest, removeMissingRegionStillWritesAndNotifies)
{
    storeRegions({region1});
    auto context = makeContext();

    context->removeExplorerRegion(region2);

    ASSERT_EQ(context->getExplorerRegions(), Strings({region1}));
    ASSERT_EQ(settings->writes().size(), 1u);
    ASSERT_EQ(changes.size(), 1u);
}

TEST_F(ContextManagerTest, malformedRegionsAreTreatedAsEmpty)
{
    settings->MemorySettingsStore::writeSetting(regionsKey, "re-gion-1", SettingsScope::Global);
    auto context = makeContext();

    ASSERT_EQ(context->getExplorerRegions(), Strings{});
    ASSERT_TRUE(capturedLog->contains(lvlWarn, "ignoring setting 'aws.explorerRegions'"));

    context->addExplorerRegion(region2);
    ASSERT_EQ(context->getExplorerRegions(), Strings({region2}));
}

TEST_F(ContextManagerTest, regionWriteFailureSuppressesNotification)
{
    storeRegions({region1});
    settings->failWrites = "disk full";
    auto context = makeContext();

    try {
        context->addExplorerRegion(region2);
        FAIL() << "expected a SettingsError";
    } catch (SettingsError & e) {
        ASSERT_THAT(e.msg(), ::testing::HasSubstr("disk full"));
        ASSERT_EQ(e.info().traces.size(), 1u);
    }

    ASSERT_EQ(context->getExplorerRegions(), Strings({region1}));
    ASSERT_TRUE(changes.empty());
}

/* ----------------------------------------------------------------------------
 * notifications
 * --------------------------------------------------------------------------*/

TEST_F(ContextManagerTest, notificationFollowsAcknowledgedWrite)
{
    auto context = makeContext();

    size_t writesSeenByListener = 0;
    auto sub = context->onDidChangeContext([&](const ContextChange &) { writesSeenByListener = settings->writes().size(); });
    settings->onWrite = [&](const RecordingSettingsStore::Write &) { ASSERT_TRUE(changes.empty()); };

    context->setCredentialProfileName(profile1);

    ASSERT_EQ(writesSeenByListener, 1u);
    ASSERT_EQ(changes.size(), 1u);
}

TEST_F(ContextManagerTest, everyMutationNotifiesWithFullSnapshot)
{
    auto context = makeContext();

    context->setCredentialProfileName(profile1);
    context->setCredentialAccountId(accountId);
    context->addExplorerRegion(region1);
    context->addExplorerRegion(region2);
    context->removeExplorerRegion(region1);

    ASSERT_EQ(
        changes,
        std::vector<ContextChange>({
            {profile1, std::nullopt, {}},
            {profile1, accountId, {}},
            {profile1, accountId, {region1}},
            {profile1, accountId, {region1, region2}},
            {profile1, accountId, {region2}},
        }));
}

TEST_F(ContextManagerTest, listenersRunInRegistrationOrder)
{
    auto context = makeContext();

    std::vector<int> order;
    auto a = context->onDidChangeContext([&](const ContextChange &) { order.push_back(1); });
    auto b = context->onDidChangeContext([&](const ContextChange &) { order.push_back(2); });

    context->addExplorerRegion(region1);

    ASSERT_EQ(order, std::vector<int>({1, 2}));
}

TEST_F(ContextManagerTest, destroyedSubscriptionIsNotNotified)
{
    auto context = makeContext();

    subscription.reset();
    context->addExplorerRegion(region1);

    ASSERT_TRUE(changes.empty());
}

TEST_F(ContextManagerTest, listenerMayCallBackIntoManager)
{
    auto context = makeContext();

    Strings seen;
    auto sub = context->onDidChangeContext([&](const ContextChange & change) {
        seen = context->getExplorerRegions();
        if (change.accountId == std::nullopt)
            context->setCredentialAccountId(accountId);
    });

    context->addExplorerRegion(region1);

    ASSERT_EQ(seen, Strings({region1}));
    ASSERT_EQ(context->getCredentialAccountId(), accountId);
    ASSERT_EQ(changes.size(), 2u);
}

TEST_F(ContextManagerTest, concurrentRegionMutationsAreNotLost)
{
    auto context = makeContext();

    const int threadCount = 8;
    const int perThread = 25;

    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; t++)
        threads.emplace_back([&, t]() {
            for (int i = 0; i < perThread; i++)
                context->addExplorerRegion(fmt("re-gion-%d-%d", t, i));
        });
    for (auto & thread : threads)
        thread.join();

    ASSERT_EQ(context->getExplorerRegions().size(), size_t(threadCount * perThread));
    ASSERT_EQ(changes.size(), size_t(threadCount * perThread));
    for (size_t i = 0; i < changes.size(); i++)
        ASSERT_EQ(changes[i].regions.size(), i + 1);
}

/* ----------------------------------------------------------------------------
 * ContextChange
 * --------------------------------------------------------------------------*/

TEST(ContextChange, toJSON)
{
    ContextChange change{profile1, std::nullopt, {region1, region2}};

    ASSERT_EQ(
        nlohmann::json(change),
        R"({"profileName": "profile1", "accountId": null, "regions": ["re-gion-1", "re-gion-2"]})"_json);
}

} // namespace awsctx
