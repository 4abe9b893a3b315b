#include <tether/model/document_key.hpp>

#include <sstream>
#include <unordered_set>

#include <tether/utilities/testing.hpp>

using namespace tether;

TEST_CASE("document key construction", "[model][document_key]")
{
    auto key = document_key::from_path_string("rooms/eros/messages/1");
    REQUIRE(
        key.segments()
        == (std::vector<string>{"rooms", "eros", "messages", "1"}));
    REQUIRE(key.document_id() == "1");
    REQUIRE(key.to_string() == "rooms/eros/messages/1");
    REQUIRE(!key.empty());

    std::ostringstream stream;
    stream << key;
    REQUIRE(stream.str() == "rooms/eros/messages/1");

    REQUIRE(document_key().empty());
}

TEST_CASE("invalid document keys", "[model][document_key]")
{
    REQUIRE_THROWS_AS(
        document_key::from_path_string("rooms"), invalid_document_key);
    REQUIRE_THROWS_AS(
        document_key::from_path_string("rooms//messages/1"),
        invalid_document_key);
    REQUIRE_THROWS_AS(document_key::from_path_string(""), invalid_document_key);

    try
    {
        document_key::from_path_string("rooms/eros/messages");
        FAIL("no exception thrown");
    }
    catch (invalid_document_key& e)
    {
        REQUIRE(
            get_required_error_info<document_path_info>(e)
            == "rooms/eros/messages");
    }

    REQUIRE_THROWS_AS(document_key().document_id(), internal_check_failed);
}

TEST_CASE("document key comparison and hashing", "[model][document_key]")
{
    auto a = document_key::from_path_string("rooms/a");
    auto a_child = document_key::from_path_string("rooms/a/messages/1");
    auto b = document_key::from_path_string("rooms/b");

    REQUIRE(a == document_key::from_path_string("rooms/a"));
    REQUIRE(a != b);
    REQUIRE(a < b);
    REQUIRE(a < a_child);
    REQUIRE(a_child < b);
    REQUIRE(!(b < a));

    REQUIRE(
        hash_value(a) == hash_value(document_key::from_path_string("rooms/a")));

    std::unordered_set<document_key> keys{a, b, a_child};
    REQUIRE(keys.size() == 3);
    REQUIRE(keys.count(document_key::from_path_string("rooms/b")) == 1);
}
