#include <gtest/gtest.h>
#include "record_store.h"
#include "test_helpers.h"
#include <thread>

using namespace cloudless;
using namespace cloudless::testing_support;

class MemoryRecordStoreTest : public ::testing::Test {
protected:
    Transfer make_transfer(const std::string& id, const std::string& room_id, Timestamp created_at) {
        Transfer transfer;
        transfer.id = id;
        transfer.room_id = room_id;
        transfer.sender_id = "alice";
        transfer.encrypted_filename = "enc-name";
        transfer.file_size = 100;
        transfer.nonce = "nonce";
        transfer.total_chunks = 2;
        transfer.received_chunks = ChunkBitfield(2);
        transfer.created_at = created_at;
        return transfer;
    }

    MemoryRecordStore store_;
    TempDirectory dir_;
};

TEST_F(MemoryRecordStoreTest, RoomInsertAndLookup) {
    Room room = make_room("r1");
    EXPECT_TRUE(store_.insert_room(room));
    EXPECT_FALSE(store_.insert_room(room));

    auto loaded = store_.get_room("r1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->code, "RR1");
    EXPECT_FALSE(store_.get_room("missing").has_value());
}

TEST_F(MemoryRecordStoreTest, FindRoomByCodeIgnoresCase) {
    ASSERT_TRUE(store_.insert_room(make_room("abc")));
    auto found = store_.find_room_by_code("rabc");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, "abc");
}

TEST_F(MemoryRecordStoreTest, MutatorReturningFalseLeavesRecordUntouched) {
    ASSERT_TRUE(store_.insert_room(make_room("r1")));

    EXPECT_FALSE(store_.update_room("r1", [](Room& room) {
        room.is_active = false;
        return false;
    }));
    EXPECT_TRUE(store_.get_room("r1")->is_active);

    EXPECT_TRUE(store_.update_room("r1", [](Room& room) {
        room.is_active = false;
        return true;
    }));
    EXPECT_FALSE(store_.get_room("r1")->is_active);

    EXPECT_FALSE(store_.update_room("missing", [](Room&) { return true; }));
}

TEST_F(MemoryRecordStoreTest, UpsertMemberKeepsOneRowPerPair) {
    store_.upsert_member(make_member("r1", "alice", "KEY1"));
    store_.upsert_member(make_member("r1", "alice", "KEY2"));
    store_.upsert_member(make_member("r1", "bob"));
    store_.upsert_member(make_member("r2", "alice"));

    EXPECT_EQ(store_.member_count(), 3);
    EXPECT_EQ(store_.get_member("r1", "alice")->public_key, "KEY2");
    EXPECT_EQ(store_.list_members("r1").size(), 2);
}

TEST_F(MemoryRecordStoreTest, DeleteMembersForRoom) {
    store_.upsert_member(make_member("r1", "alice"));
    store_.upsert_member(make_member("r1", "bob"));
    store_.upsert_member(make_member("r2", "carol"));

    EXPECT_TRUE(store_.delete_member("r1", "alice"));
    EXPECT_FALSE(store_.delete_member("r1", "alice"));
    EXPECT_EQ(store_.delete_members_for_room("r1"), 1);
    EXPECT_EQ(store_.member_count(), 1);
}

TEST_F(MemoryRecordStoreTest, TransfersListedNewestFirst) {
    Timestamp now = Clock::now();
    ASSERT_TRUE(store_.insert_transfer(make_transfer("old", "r1", now - std::chrono::minutes(5))));
    ASSERT_TRUE(store_.insert_transfer(make_transfer("new", "r1", now)));
    ASSERT_TRUE(store_.insert_transfer(make_transfer("other", "r2", now)));

    auto transfers = store_.list_transfers_for_room("r1");
    ASSERT_EQ(transfers.size(), 2);
    EXPECT_EQ(transfers[0].id, "new");
    EXPECT_EQ(transfers[1].id, "old");

    EXPECT_EQ(store_.transfer_ids().size(), 3);
    EXPECT_TRUE(store_.delete_transfer("old"));
    EXPECT_FALSE(store_.delete_transfer("old"));
}

TEST_F(MemoryRecordStoreTest, ConcurrentUpdatesAreAtomic) {
    ASSERT_TRUE(store_.insert_transfer(make_transfer("t1", "r1", Clock::now())));

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this]() {
            for (int j = 0; j < 250; ++j) {
                store_.update_transfer("t1", [](Transfer& t) {
                    t.download_count++;
                    return true;
                });
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(store_.get_transfer("t1")->download_count, 2000);
}

TEST_F(MemoryRecordStoreTest, MessagesByRoom) {
    Message message;
    message.id = "m1";
    message.room_id = "r1";
    message.sender_id = "alice";
    message.encrypted_content = "ciphertext";
    message.nonce = "n";
    message.created_at = Clock::now();
    EXPECT_TRUE(store_.insert_message(message));
    message.id = "m2";
    message.room_id = "r2";
    EXPECT_TRUE(store_.insert_message(message));

    EXPECT_EQ(store_.list_messages_for_room("r1").size(), 1);
    EXPECT_EQ(store_.delete_messages_for_room("r1"), 1);
    EXPECT_EQ(store_.message_count(), 1);
}

TEST_F(MemoryRecordStoreTest, SnapshotRoundTripResetsPresence) {
    ASSERT_TRUE(store_.insert_room(make_room("r1")));
    Member online = make_member("r1", "alice");
    online.is_online = true;
    store_.upsert_member(online);

    Transfer transfer = make_transfer("t1", "r1", Clock::now());
    transfer.received_chunks.set_bit(1);
    transfer.uploaded_chunks = 1;
    transfer.status = TransferStatus::UPLOADING;
    ASSERT_TRUE(store_.insert_transfer(transfer));

    std::string path = dir_.file("state.json");
    ASSERT_TRUE(store_.save_snapshot(path));

    MemoryRecordStore restored;
    ASSERT_TRUE(restored.load_snapshot(path));
    EXPECT_EQ(restored.room_count(), 1);
    EXPECT_FALSE(restored.get_member("r1", "alice")->is_online);

    auto loaded = restored.get_transfer("t1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, TransferStatus::UPLOADING);
    EXPECT_TRUE(loaded->received_chunks.get_bit(1));
    EXPECT_FALSE(loaded->received_chunks.get_bit(0));
}

TEST_F(MemoryRecordStoreTest, LoadSnapshotRejectsMissingAndCorruptFiles) {
    EXPECT_FALSE(store_.load_snapshot(dir_.file("missing.json")));

    std::string path = dir_.file("corrupt.json");
    ASSERT_TRUE(create_file(path, "{not json"));
    EXPECT_FALSE(store_.load_snapshot(path));
}
