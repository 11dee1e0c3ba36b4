#include <gtest/gtest.h>

#include "awsctx/util/json-utils.hh"

namespace awsctx {

TEST(optionalSerializer, nulloptIsNull)
{
    std::optional<std::string> profile = "profile1";
    ASSERT_EQ(nlohmann::json(profile), nlohmann::json("profile1"));

    profile = std::nullopt;
    ASSERT_TRUE(nlohmann::json(profile).is_null());
}

TEST(optionalSerializer, nullReadsBackAsNullopt)
{
    auto json = R"({ "profile": "profile1", "accountId": null })"_json;

    ASSERT_EQ(json["profile"].get<std::optional<std::string>>(), "profile1");
    ASSERT_EQ(json["accountId"].get<std::optional<std::string>>(), std::nullopt);
}

TEST(getObject, acceptsOnlyObjects)
{
    ASSERT_EQ(getObject(R"({ "a": 1 })"_json).size(), 1u);
    ASSERT_THROW(getObject(R"([])"_json), Error);
    ASSERT_THROW(getObject(R"(null)"_json), Error);
}

TEST(getString, acceptsOnlyStrings)
{
    ASSERT_EQ(getString(R"("")"_json), "");
    ASSERT_THROW(getString(R"(42)"_json), Error);
    ASSERT_THROW(getString(R"(["profile1"])"_json), Error);
}

TEST(getString, errorNamesBothTypes)
{
    try {
        getString(R"(42)"_json);
        FAIL() << "expected an Error";
    } catch (Error & e) {
        ASSERT_NE(e.message().find("string"), std::string::npos);
        ASSERT_NE(e.message().find("number"), std::string::npos);
    }
}

TEST(getStringList, keepsOrderAndDuplicates)
{
    auto json = R"(["re-gion-2", "re-gion-1", "re-gion-2"])"_json;

    ASSERT_EQ(getStringList(json), Strings({"re-gion-2", "re-gion-1", "re-gion-2"}));
}

TEST(getStringList, rejectsNonStrings)
{
    ASSERT_THROW(getStringList(R"(["a", 1])"_json), Error);
    ASSERT_THROW(getStringList(R"("a")"_json), Error);
}

} // namespace awsctx
