// test_ffi.cpp — C API wiring: handles, errors and ownership
// These tests catch bugs where handles outlive what they depend on

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

#include "balance/balance_c.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

/// Take ownership of an API string
json takeJson(char* str) {
    EXPECT_NE(str, nullptr) << bl_last_error_message();
    if (!str) return json();
    json j = json::parse(str);
    bl_free_string(str);
    return j;
}

std::string takeString(char* str) {
    EXPECT_NE(str, nullptr) << bl_last_error_message();
    if (!str) return "";
    std::string s(str);
    bl_free_string(str);
    return s;
}

} // anonymous namespace

class FFIStoreTest : public ::testing::Test {
protected:
    fs::path tempDir;
    BLStore store = nullptr;

    BLStore openStore(const std::string& name) {
        BLError err = BL_ERROR_INTERNAL;
        BLStore s = bl_store_open((tempDir / name).string().c_str(), &err);
        EXPECT_NE(s, nullptr);
        EXPECT_EQ(err, BL_OK);
        return s;
    }

    void SetUp() override {
        tempDir = fs::temp_directory_path() /
                  ("bl_ffi_test_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(tempDir);
        store = openStore("balance.db");
    }

    void TearDown() override {
        if (store) {
            EXPECT_EQ(bl_store_close(store), BL_OK);
        }
        fs::remove_all(tempDir);
    }
};

// ═══════════════════════════════════════════════════════════
// Store
// ═══════════════════════════════════════════════════════════

TEST_F(FFIStoreTest, OpenWithNullPathFails) {
    BLError err = BL_OK;
    EXPECT_EQ(bl_store_open(nullptr, &err), nullptr);
    EXPECT_EQ(err, BL_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(bl_last_error(), BL_ERROR_INVALID_ARGUMENT);
}

TEST_F(FFIStoreTest, EnsurePreferencesAssignsDeviceIdOnce) {
    json first = takeJson(bl_store_ensure_preferences(store));
    ASSERT_TRUE(first["deviceId"].is_string());
    EXPECT_FALSE(first["deviceId"].get<std::string>().empty());

    json second = takeJson(bl_store_ensure_preferences(store));
    EXPECT_EQ(second["deviceId"], first["deviceId"]);

    json read = takeJson(bl_store_get_preferences(store));
    EXPECT_EQ(read["deviceId"], first["deviceId"]);
}

TEST_F(FFIStoreTest, SetPreferencesRejectsGarbage) {
    EXPECT_EQ(bl_store_set_preferences(store, "{not json"), BL_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(bl_last_error(), BL_ERROR_INVALID_ARGUMENT);
    EXPECT_NE(std::string(bl_last_error_message()), "");
}

TEST_F(FFIStoreTest, SaveRequiresDeviceId) {
    EXPECT_EQ(bl_store_save_entity(store, "dateNightIdeas", R"({"title":"Picnic"})"), nullptr);
    EXPECT_EQ(bl_last_error(), BL_ERROR_DATABASE);
}

TEST_F(FFIStoreTest, SaveListDelete) {
    json prefs = takeJson(bl_store_ensure_preferences(store));
    const std::string deviceId = prefs["deviceId"];

    json saved = takeJson(bl_store_save_entity(store, "dateNightIdeas", R"({"id":0,"title":"Picnic"})"));
    ASSERT_TRUE(saved["id"].is_number_integer());
    EXPECT_GT(saved["id"].get<int64_t>(), 0);
    EXPECT_EQ(saved["deviceId"], deviceId);
    EXPECT_GT(saved["updatedAt"].get<int64_t>(), 0);

    json list = takeJson(bl_store_list_entities(store, "dateNightIdeas"));
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0]["title"], "Picnic");

    const int64_t id = saved["id"];
    EXPECT_EQ(bl_store_delete_entity(store, "dateNightIdeas", id), BL_OK);
    list = takeJson(bl_store_list_entities(store, "dateNightIdeas"));
    ASSERT_EQ(list.size(), 1u);
    EXPECT_TRUE(list[0]["deletedAt"].is_number_integer());

    EXPECT_EQ(bl_store_delete_entity(store, "dateNightIdeas", 9999), BL_ERROR_NOT_FOUND);
}

TEST_F(FFIStoreTest, UnknownEntityTypeRejected) {
    takeJson(bl_store_ensure_preferences(store));
    EXPECT_EQ(bl_store_list_entities(store, "spaceships"), nullptr);
    EXPECT_EQ(bl_last_error(), BL_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(bl_store_save_entity(store, "dateNightIdeas", R"({"notitle":true})"), nullptr);
    EXPECT_EQ(bl_last_error(), BL_ERROR_INVALID_ARGUMENT);
}

// ═══════════════════════════════════════════════════════════
// Backup
// ═══════════════════════════════════════════════════════════

TEST_F(FFIStoreTest, BackupExportSummaryImport) {
    takeJson(bl_store_ensure_preferences(store));
    takeJson(bl_store_save_entity(store, "dateNightIdeas", R"({"title":"Picnic"})"));

    std::string path = takeString(bl_backup_export(store, tempDir.string().c_str()));
    ASSERT_TRUE(fs::exists(path));

    json summary = takeJson(bl_backup_summary(path.c_str()));
    EXPECT_EQ(summary["entities"]["dateNightIdeas"], 1);
    EXPECT_EQ(summary["entities"]["userPreferences"], 1);

    BLStore other = openStore("other.db");
    ASSERT_NE(other, nullptr);
    json result = takeJson(bl_backup_import(other, path.c_str(), BL_IMPORT_REPLACE));
    EXPECT_EQ(result["mode"], "replace");

    json list = takeJson(bl_store_list_entities(other, "dateNightIdeas"));
    EXPECT_EQ(list.size(), 1u);
    EXPECT_EQ(bl_store_close(other), BL_OK);
}

TEST_F(FFIStoreTest, SummaryOfForeignFileFails) {
    fs::path path = tempDir / "foreign.json";
    {
        std::ofstream out(path);
        out << R"({"format":"something-else","version":1})";
    }
    EXPECT_EQ(bl_backup_summary(path.string().c_str()), nullptr);
    EXPECT_EQ(bl_last_error(), BL_ERROR_INVALID_ARGUMENT);
    EXPECT_NE(std::string(bl_last_error_message()).find("format"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════
// Sessions pin the store
// ═══════════════════════════════════════════════════════════

TEST_F(FFIStoreTest, StoreCannotCloseUnderSession) {
    takeJson(bl_store_ensure_preferences(store));

    BLSyncSession session = bl_sync_session_create(store, BL_NETWORK_LOCAL);
    ASSERT_NE(session, nullptr);
    EXPECT_STREQ(bl_sync_state(session), "idle");

    EXPECT_EQ(bl_store_close(store), BL_ERROR_BUSY);

    bl_sync_session_destroy(session);
}

TEST_F(FFIStoreTest, WrongOrderIsBusy) {
    takeJson(bl_store_ensure_preferences(store));
    BLSyncSession session = bl_sync_session_create(store, BL_NETWORK_LOCAL);
    ASSERT_NE(session, nullptr);

    EXPECT_EQ(bl_sync_complete(session, R"(["1/1|x"])", nullptr, nullptr), nullptr);
    EXPECT_EQ(bl_last_error(), BL_ERROR_BUSY);
    EXPECT_EQ(bl_last_transport_code(), 6);

    json codes = takeJson(bl_sync_start_initiator(session));
    ASSERT_TRUE(codes.is_array());
    EXPECT_GE(codes.size(), 1u);
    EXPECT_STREQ(bl_sync_state(session), "offer-created");

    bl_sync_cancel(session);
    EXPECT_STREQ(bl_sync_state(session), "closed");
    bl_sync_session_destroy(session);
}

TEST_F(FFIStoreTest, BadOfferCodesReportNetworkError) {
    takeJson(bl_store_ensure_preferences(store));
    BLSyncSession session = bl_sync_session_create(store, BL_NETWORK_LOCAL);
    ASSERT_NE(session, nullptr);

    EXPECT_EQ(bl_sync_accept_offer(session, R"(["1/2|abc"])"), nullptr);
    EXPECT_EQ(bl_last_error(), BL_ERROR_NETWORK);
    EXPECT_EQ(bl_last_transport_code(), 1);

    EXPECT_EQ(bl_sync_accept_offer(session, "not-an-array"), nullptr);
    EXPECT_EQ(bl_last_error(), BL_ERROR_INVALID_ARGUMENT);

    bl_sync_session_destroy(session);
}

namespace {

void countProgress(const char* progress, void* userData) {
    json j = json::parse(progress);
    if (j.contains("phase")) {
        ++*static_cast<int*>(userData);
    }
}

} // anonymous namespace

TEST_F(FFIStoreTest, LoopbackSyncThroughCApi) {
    takeJson(bl_store_ensure_preferences(store));
    takeJson(bl_store_save_entity(store, "dateNightIdeas", R"({"title":"Picnic"})"));

    BLStore partner = openStore("partner.db");
    ASSERT_NE(partner, nullptr);
    takeJson(bl_store_ensure_preferences(partner));

    BLSyncSession initiator = bl_sync_session_create(store, BL_NETWORK_LOCAL);
    BLSyncSession joiner = bl_sync_session_create(partner, BL_NETWORK_LOCAL);
    ASSERT_NE(initiator, nullptr);
    ASSERT_NE(joiner, nullptr);

    std::string offerCodes = takeString(bl_sync_start_initiator(initiator));
    std::string answerCodes = takeString(bl_sync_accept_offer(joiner, offerCodes.c_str()));

    char* joinerSummary = nullptr;
    int joinerEvents = 0;
    std::thread joinerThread([&]() {
        joinerSummary = bl_sync_wait_for_partner(joiner, countProgress, &joinerEvents);
    });

    int initiatorEvents = 0;
    json summary = takeJson(bl_sync_complete(initiator, answerCodes.c_str(), countProgress, &initiatorEvents));
    joinerThread.join();

    EXPECT_EQ(summary["totalSent"], 1);
    json partnerSummary = takeJson(joinerSummary);
    EXPECT_EQ(partnerSummary["totalNew"], 1);
    EXPECT_GT(initiatorEvents, 0);
    EXPECT_GT(joinerEvents, 0);

    json list = takeJson(bl_store_list_entities(partner, "dateNightIdeas"));
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0]["title"], "Picnic");

    bl_sync_session_destroy(initiator);
    bl_sync_session_destroy(joiner);
    EXPECT_EQ(bl_store_close(partner), BL_OK);
}

// ═══════════════════════════════════════════════════════════
// Chunk assembler
// ═══════════════════════════════════════════════════════════

TEST(FFIChunkAssemblerTest, CollectsParts) {
    BLChunkAssembler assembler = bl_chunk_assembler_create();
    ASSERT_NE(assembler, nullptr);

    EXPECT_EQ(bl_chunk_assembler_add(assembler, "2/2|world"), 0);
    EXPECT_EQ(bl_chunk_assembler_result(assembler), nullptr);

    json progress = takeJson(bl_chunk_assembler_progress(assembler));
    EXPECT_EQ(progress["received"], 1);
    EXPECT_EQ(progress["total"], 2);
    EXPECT_EQ(progress["complete"], false);

    EXPECT_EQ(bl_chunk_assembler_add(assembler, "1/2|hello "), 1);
    EXPECT_EQ(takeString(bl_chunk_assembler_result(assembler)), "hello world");

    bl_chunk_assembler_reset(assembler);
    progress = takeJson(bl_chunk_assembler_progress(assembler));
    EXPECT_EQ(progress["total"], 0);

    EXPECT_EQ(bl_chunk_assembler_add(assembler, nullptr), -1);
    bl_chunk_assembler_destroy(assembler);
}

TEST(FFIMiscTest, RemoteErrorMessage) {
    std::string text = takeString(bl_remote_error_message("ICE failed"));
    EXPECT_EQ(text.rfind("Remote connection failed", 0), 0u);
}
