#include <snitch/snitch.hpp>
#include <kvds/memstore.hpp>
#include <names/names.hpp>
#include <session/builder.hpp>
#include <session/session.hpp>
#include <spdlog/sinks/null_sink.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <thread>

using namespace tome;

namespace {
    void ensure_db_cleanup(const std::string& path) {
        std::filesystem::remove_all(path);
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::string get_unique_test_path(const std::string& base) {
        static std::atomic<int> counter{0};
        return base + "_" + std::to_string(counter.fetch_add(1)) + "_" +
               std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    }

    std::shared_ptr<spdlog::logger> create_test_logger() {
        auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
        return std::make_shared<spdlog::logger>("session_test", sink);
    }

    struct person_s {
        static constexpr const char *type_name = "test::person";
        std::string name;
        NLOHMANN_DEFINE_TYPE_INTRUSIVE(person_s, name)
    };

    struct invoice_s {
        static constexpr const char *type_name = "test::invoice";
        int total{0};
        NLOHMANN_DEFINE_TYPE_INTRUSIVE(invoice_s, total)
    };

    struct misnamed_s {
        static constexpr const char *type_name = "test|misnamed";
        int value{0};
        NLOHMANN_DEFINE_TYPE_INTRUSIVE(misnamed_s, value)
    };

    // Counts store calls and injects failures; outlives the store it watches.
    struct store_calls_s {
        int commit_calls{0};
        int compact_calls{0};
        int close_calls{0};
        int abort_calls{0};
        int open_map_calls{0};
        bool commit_throws{false};
        std::optional<status_c> close_failure;
        std::optional<status_c> abort_failure;
    };

    class counting_store_c : public kvds::store_if {
    public:
        counting_store_c(std::shared_ptr<store_calls_s> calls, bool read_only)
            : calls_(std::move(calls)), read_only_(read_only) {}

        result_c<kvds::kv_t> open_map(const std::string &name) override {
            calls_->open_map_calls++;
            return inner_.open_map(name);
        }
        bool has_map(const std::string &name) const override {
            return inner_.has_map(name);
        }
        status_c remove_map(const std::string &name) override {
            return inner_.remove_map(name);
        }
        std::vector<std::string> get_map_names() const override {
            return inner_.get_map_names();
        }
        bool has_unsaved_changes() const override {
            return inner_.has_unsaved_changes();
        }
        status_c commit() override {
            calls_->commit_calls++;
            if (calls_->commit_throws) {
                throw 7;
            }
            return inner_.commit();
        }
        status_c compact_move_chunks() override {
            calls_->compact_calls++;
            return inner_.compact_move_chunks();
        }
        status_c close() override {
            calls_->close_calls++;
            auto status = inner_.close();
            return calls_->close_failure.value_or(status);
        }
        status_c close_immediately() override {
            calls_->abort_calls++;
            auto status = inner_.close_immediately();
            return calls_->abort_failure.value_or(status);
        }
        bool is_closed() const override { return inner_.is_closed(); }
        bool is_read_only() const override { return read_only_; }

    private:
        std::shared_ptr<store_calls_s> calls_;
        const bool read_only_;
        kvds::memstore_c inner_;
    };

    class throwing_repository_c : public doc::repository_if {
    public:
        throwing_repository_c(doc::collection_t collection, bool foreign = false)
            : collection_(std::move(collection)), foreign_(foreign) {}

        const std::string &get_type_name() const override { return type_name_; }
        doc::collection_t document_collection() const override { return collection_; }
        status_c close() override {
            if (foreign_) {
                throw 42;
            }
            throw std::runtime_error("close exploded");
        }
        bool is_closed() const override { return false; }

    private:
        std::string type_name_{"test::throwing"};
        doc::collection_t collection_;
        const bool foreign_;
    };

    std::unique_ptr<session::session_c>
    make_session(std::shared_ptr<store_calls_s> calls, bool read_only = false,
                 bool auto_compact = true,
                 std::vector<std::string> existing_maps = {}) {
        auto store = std::make_unique<counting_store_c>(calls, read_only);
        for (const auto &name : existing_maps) {
            CHECK(store->open_map(name).is_success());
        }
        auto context = std::make_unique<context::context_c>(
            read_only, auto_compact, create_test_logger());
        return std::make_unique<session::session_c>(std::move(store),
                                                    std::move(context));
    }

    template <typename T> bool contains(const std::vector<T> &items, const T &item) {
        return std::find(items.begin(), items.end(), item) != items.end();
    }
}

TEST_CASE("session opens collections idempotently", "[unit][session]") {
    auto calls = std::make_shared<store_calls_s>();
    auto session = make_session(calls);

    auto first = session->get_collection("users");
    auto second = session->get_collection("users");
    REQUIRE(first.is_success());
    REQUIRE(second.is_success());
    CHECK((first.value() == second.value()));

    auto id = first.value()->insert({{"name", "alice"}});
    REQUIRE(id.is_success());
    CHECK(second.value()->get_by_id(id.value()).has_value());
    CHECK(session->list_collection_names().size() == 1);

    SECTION("a dropped collection reopens empty") {
        CHECK(first.value()->drop().is_success());
        CHECK_FALSE(session->has_collection("users"));

        auto reopened = session->get_collection("users");
        REQUIRE(reopened.is_success());
        CHECK((reopened.value() != first.value()));
        CHECK(reopened.value()->size() == 0);
    }

    SECTION("concurrent callers share one collection") {
        std::vector<doc::collection_t> results(8);
        std::vector<std::thread> threads;
        for (std::size_t i = 0; i < results.size(); i++) {
            threads.emplace_back([&, i]() {
                auto collection = session->get_collection("shared");
                if (collection.is_success()) {
                    results[i] = collection.value();
                }
            });
        }
        for (auto &thread : threads) {
            thread.join();
        }
        for (const auto &result : results) {
            REQUIRE((result != nullptr));
            CHECK((result == results[0]));
        }
    }
}

TEST_CASE("session rejects reserved collection names", "[unit][session]") {
    auto calls = std::make_shared<store_calls_s>();
    auto session = make_session(calls);

    const std::vector<std::string> invalid = {
        "",
        "a|b",
        names::USER_MAP,
        "my$tome_users",
        "$tome_index_meta|users",
        "$tome_index|users|email",
        "$tome_index",
        "test::person:",
    };

    for (const auto &name : invalid) {
        CHECK(session->get_collection(name).is(error_e::INVALID_NAME));
    }
    CHECK(calls->open_map_calls == 0);
    CHECK(session->list_collection_names().empty());
    CHECK(session->list_repositories().empty());
    CHECK_FALSE(session->has_unsaved_changes());

    SECTION("name check runs before the closed check") {
        CHECK(session->close().is_success());
        CHECK(session->get_collection("a|b").is(error_e::INVALID_NAME));
        CHECK(session->get_collection("users").is(error_e::SESSION_CLOSED));
    }
}

TEST_CASE("session repositories", "[unit][session]") {
    auto calls = std::make_shared<store_calls_s>();
    auto session = make_session(calls);

    auto people = session->get_repository<person_s>();
    REQUIRE(people.is_success());
    auto again = session->get_repository<person_s>();
    REQUIRE(again.is_success());
    CHECK((people.value() == again.value()));

    auto invoices = session->get_repository<invoice_s>();
    REQUIRE(invoices.is_success());
    CHECK(people.value()->document_collection()->get_name() != invoices.value()->document_collection()->get_name());

    auto id = people.value()->insert(person_s{"ada"});
    REQUIRE(id.is_success());
    CHECK(again.value()->get_by_id(id.value())->name == "ada");

    CHECK(session->get_repository<misnamed_s>().is(error_e::INVALID_NAME));

    CHECK(session->has_repository<person_s>());
    CHECK(session->has_repository("test::invoice"));
    CHECK_FALSE(session->has_repository<misnamed_s>());
    CHECK_FALSE(session->has_collection("test::person:"));
    CHECK(session->list_collection_names().empty());

    SECTION("repositories survive a closed repository handle") {
        CHECK(people.value()->close().is_success());
        auto reopened = session->get_repository<person_s>();
        REQUIRE(reopened.is_success());
        CHECK((reopened.value() != people.value()));
        CHECK(reopened.value()->get_by_id(id.value()).has_value());
    }
}

TEST_CASE("session lists exactly what was opened", "[unit][session]") {
    auto calls = std::make_shared<store_calls_s>();
    auto session = make_session(calls, false, true,
                                {names::USER_MAP, "$tome_index_meta|a",
                                 "$tome_index|a|field"});

    SECTION("collections first") {
        REQUIRE(session->get_collection("a").is_success());
        REQUIRE(session->get_collection("b").is_success());
        REQUIRE(session->get_repository<person_s>().is_success());
    }

    SECTION("repositories first") {
        REQUIRE(session->get_repository<person_s>().is_success());
        REQUIRE(session->get_collection("b").is_success());
        REQUIRE(session->get_collection("a").is_success());
        REQUIRE(session->get_collection("a").is_success());
    }

    auto collections = session->list_collection_names();
    std::sort(collections.begin(), collections.end());
    std::vector<std::string> expected_collections = {"a", "b"};
    CHECK((collections == expected_collections));

    std::vector<std::string> expected_repositories = {"test::person"};
    CHECK((session->list_repositories() == expected_repositories));

    CHECK(session->has_collection("a"));
    CHECK_FALSE(session->has_collection("c"));
    CHECK_FALSE(session->has_collection(names::USER_MAP));
    CHECK(session->has_repository<person_s>());
    CHECK_FALSE(session->has_repository<invoice_s>());
}

TEST_CASE("session commit and compact", "[unit][session]") {
    auto calls = std::make_shared<store_calls_s>();

    SECTION("writable session") {
        auto session = make_session(calls);
        auto collection = session->get_collection("events");
        REQUIRE(collection.is_success());
        REQUIRE(collection.value()->insert({{"kind", "login"}}).is_success());

        CHECK(session->has_unsaved_changes());
        CHECK(session->commit().is_success());
        CHECK_FALSE(session->has_unsaved_changes());
        CHECK(calls->commit_calls == 1);

        CHECK(session->compact().is_success());
        CHECK(calls->compact_calls == 1);
        CHECK_FALSE(session->has_unsaved_changes());
    }

    SECTION("read-only session skips both") {
        auto session = make_session(calls, true);
        CHECK(session->compact().is_success());
        CHECK(session->commit().is_success());
        CHECK(calls->compact_calls == 0);
        CHECK(calls->commit_calls == 0);
        CHECK_FALSE(session->is_closed());
    }
}

TEST_CASE("session close", "[unit][session]") {
    auto calls = std::make_shared<store_calls_s>();

    SECTION("commits, compacts and closes everything") {
        auto session = make_session(calls);
        auto collection = session->get_collection("events");
        REQUIRE(collection.is_success());
        auto people = session->get_repository<person_s>();
        REQUIRE(people.is_success());
        REQUIRE(collection.value()->insert({{"kind", "login"}}).is_success());

        CHECK(session->close().is_success());
        CHECK(calls->commit_calls == 1);
        CHECK(calls->compact_calls == 1);
        CHECK(calls->close_calls == 1);
        CHECK(session->is_closed());
        CHECK(collection.value()->is_closed());
        CHECK(people.value()->is_closed());
        CHECK(session->get_context().is_shutdown());
        CHECK(session->get_context().collection_registry().empty());
    }

    SECTION("clean session skips the commit") {
        auto session = make_session(calls, false, false);
        CHECK(session->close().is_success());
        CHECK(calls->commit_calls == 0);
        CHECK(calls->compact_calls == 0);
    }

    SECTION("second close does nothing") {
        auto session = make_session(calls);
        CHECK(session->close().is_success());
        CHECK(session->close().is(error_e::SESSION_CLOSED));
        CHECK(session->close_immediately().is(error_e::SESSION_CLOSED));
        CHECK(calls->close_calls == 1);
        CHECK(calls->abort_calls == 0);
    }

    SECTION("closed session answers with sentinels") {
        auto session = make_session(calls);
        REQUIRE(session->get_collection("events").is_success());
        CHECK(session->close().is_success());

        CHECK(session->is_closed());
        CHECK(session->get_collection("events").is(error_e::SESSION_CLOSED));
        CHECK(session->get_repository<person_s>().is(error_e::SESSION_CLOSED));
        CHECK(session->list_collection_names().empty());
        CHECK(session->list_repositories().empty());
        CHECK_FALSE(session->has_collection("events"));
        CHECK_FALSE(session->has_repository<person_s>());
        CHECK_FALSE(session->has_unsaved_changes());
        CHECK(session->commit().is(error_e::SESSION_CLOSED));
        CHECK(session->compact().is(error_e::SESSION_CLOSED));
        CHECK_FALSE(session->validate_user("", ""));
    }

    SECTION("one failing item does not stop the others") {
        auto session = make_session(calls);
        auto collection = session->get_collection("events");
        REQUIRE(collection.is_success());
        auto doomed = session->get_collection("doomed");
        REQUIRE(doomed.is_success());
        auto registered = session->get_context().register_repository(
            std::make_shared<throwing_repository_c>(doomed.value()));
        REQUIRE((registered != nullptr));
        auto people = session->get_repository<person_s>();
        REQUIRE(people.is_success());

        CHECK(session->close().is_success());
        CHECK(collection.value()->is_closed());
        CHECK(people.value()->is_closed());
        CHECK(calls->close_calls == 1);
        CHECK(session->is_closed());
    }

    SECTION("items throwing foreign exceptions do not stop the others") {
        auto session = make_session(calls);
        auto collection = session->get_collection("events");
        REQUIRE(collection.is_success());
        auto doomed = session->get_collection("doomed");
        REQUIRE(doomed.is_success());
        auto registered = session->get_context().register_repository(
            std::make_shared<throwing_repository_c>(doomed.value(), true));
        REQUIRE((registered != nullptr));

        CHECK(session->close().is_success());
        CHECK(collection.value()->is_closed());
        CHECK(calls->close_calls == 1);
        CHECK(session->is_closed());
    }

    SECTION("a throwing shutdown hook still releases the store") {
        auto session = make_session(calls);
        int later_hooks = 0;
        session->get_context().add_shutdown_hook([]() { throw 42; });
        session->get_context().add_shutdown_hook([&later_hooks]() { later_hooks++; });

        CHECK(session->close().is_success());
        CHECK(later_hooks == 1);
        CHECK(calls->close_calls == 1);
        CHECK(session->is_closed());
        CHECK(session->close().is(error_e::SESSION_CLOSED));
    }

    SECTION("a throwing step is reported and the store still closes") {
        auto session = make_session(calls);
        auto collection = session->get_collection("events");
        REQUIRE(collection.is_success());
        REQUIRE(collection.value()->insert({{"kind", "login"}}).is_success());
        calls->commit_throws = true;

        CHECK(session->close().is(error_e::STORE_FAILURE));
        CHECK(calls->commit_calls == 1);
        CHECK(calls->compact_calls == 1);
        CHECK(calls->close_calls == 1);
        CHECK(collection.value()->is_closed());
        CHECK(session->get_context().is_shutdown());
        CHECK(session->is_closed());
        CHECK(session->close().is(error_e::SESSION_CLOSED));
        CHECK(calls->close_calls == 1);
    }
}

TEST_CASE("session write failures on close", "[unit][session]") {
    auto calls = std::make_shared<store_calls_s>();

    SECTION("writable session reports them") {
        calls->close_failure = status_c::fail(error_e::WRITE_CAPABILITY, "read-only file");
        auto session = make_session(calls);
        CHECK(session->close().is(error_e::WRITE_CAPABILITY));
        CHECK(session->is_closed());
    }

    SECTION("read-only session suppresses them") {
        calls->close_failure = status_c::fail(error_e::WRITE_CAPABILITY, "read-only file");
        auto session = make_session(calls, true);
        CHECK(session->close().is_success());
        CHECK(session->is_closed());
    }

    SECTION("other failures always surface") {
        calls->close_failure = status_c::fail(error_e::STORE_FAILURE, "io error");
        auto session = make_session(calls, true);
        CHECK(session->close().is(error_e::STORE_FAILURE));
        CHECK(session->is_closed());
    }
}

TEST_CASE("session close immediately", "[unit][session]") {
    auto calls = std::make_shared<store_calls_s>();

    SECTION("skips commit and compaction") {
        auto session = make_session(calls);
        auto collection = session->get_collection("events");
        REQUIRE(collection.is_success());
        REQUIRE(collection.value()->insert({{"kind", "login"}}).is_success());

        CHECK(session->close_immediately().is_success());
        CHECK(calls->commit_calls == 0);
        CHECK(calls->compact_calls == 0);
        CHECK(calls->abort_calls == 1);
        CHECK(session->is_closed());
        CHECK(session->get_context().is_shutdown());
        CHECK(collection.value()->is_closed());
    }

    SECTION("writable session reports write failures only") {
        calls->abort_failure = status_c::fail(error_e::WRITE_CAPABILITY, "read-only file");
        auto session = make_session(calls);
        CHECK(session->close_immediately().is(error_e::WRITE_CAPABILITY));
        CHECK(session->is_closed());
    }

    SECTION("writable session swallows other failures") {
        calls->abort_failure = status_c::fail(error_e::STORE_FAILURE, "io error");
        auto session = make_session(calls);
        CHECK(session->close_immediately().is_success());
        CHECK(session->is_closed());
    }

    SECTION("read-only session swallows write failures") {
        calls->abort_failure = status_c::fail(error_e::WRITE_CAPABILITY, "read-only file");
        auto session = make_session(calls, true);
        CHECK(session->close_immediately().is_success());
    }

    SECTION("destroying an open session closes it gracefully") {
        {
            auto session = make_session(calls);
            auto collection = session->get_collection("events");
            REQUIRE(collection.is_success());
            REQUIRE(collection.value()->insert({{"kind", "login"}}).is_success());
        }
        CHECK(calls->commit_calls == 1);
        CHECK(calls->close_calls == 1);
        CHECK(calls->abort_calls == 0);
    }

    SECTION("destroying a closed session does nothing more") {
        {
            auto session = make_session(calls);
            CHECK(session->close().is_success());
        }
        CHECK(calls->abort_calls == 0);
        CHECK(calls->close_calls == 1);
    }
}

TEST_CASE("session users scenario across reopen", "[unit][session]") {
    std::string test_db_path = get_unique_test_path("/tmp/tome_session_users");
    ensure_db_cleanup(test_db_path);

    std::vector<doc::doc_id_t> ids;
    {
        auto opened = session::session_builder_c()
                          .file_path(test_db_path)
                          .logger(create_test_logger())
                          .open_or_create();
        REQUIRE(opened.is_success());
        auto session = opened.take();

        auto users = session->get_collection("users");
        REQUIRE(users.is_success());
        for (const auto &name : {"alice", "bob", "carol"}) {
            auto id = users.value()->insert({{"name", name}});
            REQUIRE(id.is_success());
            ids.push_back(id.value());
        }

        CHECK(session->has_unsaved_changes());
        CHECK(session->commit().is_success());
        CHECK_FALSE(session->has_unsaved_changes());
        CHECK(session->close().is_success());
        CHECK(session->is_closed());
    }

    {
        auto opened = session::session_builder_c()
                          .file_path(test_db_path)
                          .logger(create_test_logger())
                          .open_or_create();
        REQUIRE(opened.is_success());
        auto session = opened.take();

        CHECK(contains(session->list_collection_names(), std::string("users")));

        auto users = session->get_collection("users");
        REQUIRE(users.is_success());
        auto documents = users.value()->find_all();
        REQUIRE(documents.size() == 3);

        std::vector<std::string> user_names;
        for (std::size_t i = 0; i < documents.size(); i++) {
            CHECK(doc::id_of(documents[i]).value() == ids[i]);
            user_names.push_back(documents[i]["name"].get<std::string>());
        }
        std::vector<std::string> expected = {"alice", "bob", "carol"};
        CHECK((user_names == expected));

        CHECK(session->close().is_success());
    }

    ensure_db_cleanup(test_db_path);
}
