#include <snitch/snitch.hpp>
#include <doc/collection.hpp>
#include <kvds/datastore.hpp>
#include <kvds/memstore.hpp>
#include <spdlog/sinks/null_sink.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <set>
#include <thread>

using namespace tome;

namespace {
void ensure_db_cleanup(const std::string &path) {
  std::filesystem::remove_all(path);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
}

std::string get_unique_test_path(const std::string &base) {
  static std::atomic<int> counter{0};
  return base + "_" + std::to_string(counter.fetch_add(1)) + "_" +
         std::to_string(
             std::chrono::steady_clock::now().time_since_epoch().count());
}

std::shared_ptr<spdlog::logger> create_test_logger() {
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>("test", sink);
}

doc::collection_t make_collection(kvds::memstore_c &store,
                                  const std::string &name) {
  auto map = store.open_map(name);
  return std::make_shared<doc::collection_c>(name, map.take(),
                                             create_test_logger());
}
} // namespace

TEST_CASE("document ids", "[unit][doc]") {
    SECTION("ids strictly increase") {
        auto first = doc::next_doc_id();
        auto second = doc::next_doc_id();
        auto third = doc::next_doc_id();
        CHECK(first < second);
        CHECK(second < third);
    }

    SECTION("keys are fixed width and sort like ids") {
        CHECK(doc::to_key(42) == "00000000000000000042");
        CHECK(doc::to_key(9) < doc::to_key(10));

        auto id = doc::from_key("00000000000000000042");
        REQUIRE(id.has_value());
        CHECK(*id == 42);

        CHECK_FALSE(doc::from_key("42").has_value());
        CHECK_FALSE(doc::from_key("0000000000000000004x").has_value());
    }

    SECTION("id is read from the document") {
        doc::json document = {{"_id", 7u}, {"name", "x"}};
        auto id = doc::id_of(document);
        REQUIRE(id.has_value());
        CHECK(*id == 7);

        CHECK_FALSE(doc::id_of(doc::json{{"name", "x"}}).has_value());
        CHECK_FALSE(doc::id_of(doc::json::array()).has_value());
    }
}

TEST_CASE("collection document operations", "[unit][doc][collection]") {
    kvds::memstore_c store;
    auto collection = make_collection(store, "people");
    CHECK(collection->get_name() == "people");

    SECTION("insert and get") {
        auto id = collection->insert({{"name", "alice"}, {"age", 31}});
        REQUIRE(id.is_success());

        auto document = collection->get_by_id(id.value());
        REQUIRE(document.has_value());
        CHECK((*document)["name"].get<std::string>() == "alice");
        CHECK((*document)["age"].get<int>() == 31);
        CHECK((*document)[doc::DOC_ID_FIELD].get<doc::doc_id_t>() == id.value());
        CHECK(collection->size() == 1);
    }

    SECTION("insert rejects non objects") {
        CHECK(collection->insert(doc::json::array({1, 2})).is(error_e::VALIDATION));
        CHECK(collection->insert("text").is(error_e::VALIDATION));
        CHECK(collection->size() == 0);
    }

    SECTION("update replaces the document") {
        auto id = collection->insert({{"name", "bob"}});
        REQUIRE(id.is_success());

        CHECK(collection->update(id.value(), {{"name", "robert"}}).is_success());
        auto document = collection->get_by_id(id.value());
        REQUIRE(document.has_value());
        CHECK((*document)["name"].get<std::string>() == "robert");
        CHECK(doc::id_of(*document).value() == id.value());

        CHECK(collection->update(id.value() + 1000, {{"name", "x"}})
                  .is(error_e::NOT_FOUND));
        CHECK(collection->update(id.value(), doc::json::array())
                  .is(error_e::VALIDATION));
    }

    SECTION("remove") {
        auto id = collection->insert({{"name", "carol"}});
        REQUIRE(id.is_success());
        CHECK(collection->remove(id.value()).is_success());
        CHECK_FALSE(collection->get_by_id(id.value()).has_value());
        CHECK(collection->remove(id.value()).is(error_e::NOT_FOUND));
    }

    SECTION("find_all returns documents in id order") {
        std::vector<doc::doc_id_t> ids;
        for (int i = 0; i < 5; i++) {
            auto id = collection->insert({{"n", i}});
            REQUIRE(id.is_success());
            ids.push_back(id.value());
        }

        auto documents = collection->find_all();
        REQUIRE(documents.size() == 5);
        for (std::size_t i = 0; i < documents.size(); i++) {
            CHECK(doc::id_of(documents[i]).value() == ids[i]);
        }
    }

    SECTION("for_each skips foreign and corrupt entries") {
        auto map = store.open_map("people");
        REQUIRE(map.is_success());
        CHECK(map.value()->set("not-a-key", "{}"));
        CHECK(map.value()->set(doc::to_key(1), "{broken"));
        auto id = collection->insert({{"name", "dave"}});
        REQUIRE(id.is_success());

        std::set<doc::doc_id_t> seen;
        collection->for_each([&seen](doc::doc_id_t id, const doc::json &) {
            seen.insert(id);
            return true;
        });
        CHECK(seen.size() == 1);
        CHECK(seen.count(id.value()) == 1);
    }

    SECTION("for_each callbacks can write to the collection") {
        auto first = collection->insert({{"name", "erin"}});
        auto second = collection->insert({{"name", "frank"}});
        REQUIRE(first.is_success());
        REQUIRE(second.is_success());

        int visited = 0;
        collection->for_each([&](doc::doc_id_t id, const doc::json &document) {
            doc::json renamed = document;
            renamed["name"] = document["name"].get<std::string>() + "!";
            CHECK(collection->update(id, renamed).is_success());
            CHECK(collection->insert({{"name", "guest"}}).is_success());
            visited++;
            return true;
        });
        CHECK(visited == 2);
        CHECK(collection->size() == 4);
        CHECK((*collection->get_by_id(first.value()))["name"].get<std::string>() == "erin!");

        int stopped = 0;
        collection->for_each([&](doc::doc_id_t id, const doc::json &) {
            CHECK(collection->remove(id).is_success());
            stopped++;
            return false;
        });
        CHECK(stopped == 1);
        CHECK(collection->size() == 3);
    }
}

TEST_CASE("collection iteration over a datastore", "[unit][doc][collection]") {
    std::string test_db_path = get_unique_test_path("/tmp/tome_collection_iterate");
    ensure_db_cleanup(test_db_path);

    kvds::datastore_c store(create_test_logger());
    kvds::datastore_c::options_s options;
    options.auto_commit = false;
    REQUIRE(store.open(test_db_path, options).is_success());

    auto map = store.open_map("people");
    REQUIRE(map.is_success());
    auto collection = std::make_shared<doc::collection_c>("people", map.take(),
                                                          create_test_logger());
    auto id = collection->insert({{"name", "hana"}});
    REQUIRE(id.is_success());

    bool opened = false;
    collection->for_each([&](doc::doc_id_t each, const doc::json &document) {
        CHECK(collection->update(each, document).is_success());
        auto archive = store.open_map("archive");
        CHECK(archive.is_success());
        if (archive.is_success()) {
            CHECK(archive.value()->set(doc::to_key(each), document.dump()));
            opened = true;
        }
        return true;
    });
    CHECK(opened);
    CHECK(store.has_map("archive"));
    CHECK(collection->size() == 1);

    CHECK(store.close().is_success());
    ensure_db_cleanup(test_db_path);
}

TEST_CASE("collection close and drop", "[unit][doc][collection]") {
    kvds::memstore_c store;
    auto collection = make_collection(store, "events");
    auto id = collection->insert({{"kind", "login"}});
    REQUIRE(id.is_success());

    SECTION("closed collection refuses work") {
        CHECK(collection->close().is_success());
        CHECK(collection->is_closed());
        CHECK_FALSE(collection->is_dropped());
        CHECK(collection->close().is(error_e::COLLECTION_CLOSED));
        CHECK(collection->insert({{"kind", "logout"}}).is(error_e::COLLECTION_CLOSED));
        CHECK(collection->remove(id.value()).is(error_e::COLLECTION_CLOSED));
        CHECK_FALSE(collection->get_by_id(id.value()).has_value());
        CHECK(collection->size() == 0);
        CHECK(store.has_map("events"));
    }

    SECTION("drop removes the map") {
        CHECK(collection->drop().is_success());
        CHECK(collection->is_dropped());
        CHECK(collection->is_closed());
        CHECK_FALSE(store.has_map("events"));
        CHECK(collection->drop().is(error_e::COLLECTION_CLOSED));
    }

    SECTION("closing the store closes the collection") {
        CHECK(store.close().is_success());
        CHECK(collection->is_closed());
        CHECK(collection->insert({{"kind", "x"}}).is(error_e::COLLECTION_CLOSED));
    }
}
