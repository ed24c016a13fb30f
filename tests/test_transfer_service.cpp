#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "transfer_service.h"
#include "test_helpers.h"
#include <atomic>
#include <thread>

using namespace cloudless;
using namespace cloudless::testing_support;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgReferee;

namespace {

TransferSettings small_chunk_settings() {
    TransferSettings settings;
    settings.chunk_size = 100;
    settings.max_file_size = 10000;
    return settings;
}

TransferRequest make_request(const std::string& room_id, int64_t file_size, const std::string& mode = "relay") {
    TransferRequest request;
    request.room_id = room_id;
    request.encrypted_filename = "ENC_NAME";
    request.file_size = file_size;
    request.nonce = "NONCE";
    request.mode = mode;
    request.max_downloads = 1;
    return request;
}

} // namespace

class TransferServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.insert_room(make_room("r1"));
        store_.upsert_member(make_member("r1", "alice"));
        store_.upsert_member(make_member("r1", "bob"));
        blobs_.reset(new FileBlobStore(dir_.file("uploads")));
        service_.reset(new TransferService(store_, *blobs_, presence_, locks_, small_chunk_settings()));
    }

    Transfer init(int64_t file_size, int64_t max_downloads = 1) {
        TransferRequest request = make_request("r1", file_size);
        request.max_downloads = max_downloads;
        TransferResult result = service_->initialize_transfer("alice", request);
        EXPECT_TRUE(result.ok()) << result.error_message;
        return result.transfer;
    }

    void upload_all(const Transfer& transfer, const std::vector<uint8_t>& payload) {
        for (uint32_t i = 0; i < transfer.total_chunks; ++i) {
            size_t begin = i * 100;
            size_t end = std::min(payload.size(), begin + 100);
            std::vector<uint8_t> chunk(payload.begin() + begin, payload.begin() + end);
            ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, i, chunk).ok());
        }
    }

    TempDirectory dir_;
    MemoryRecordStore store_;
    PresenceRegistry presence_{store_};
    TransferLockTable locks_;
    std::unique_ptr<FileBlobStore> blobs_;
    std::unique_ptr<TransferService> service_;
};

TEST(TransferLockTableTest, SameIdSameStripe) {
    TransferLockTable table(8);
    EXPECT_EQ(&table.lock_for("abc"), &table.lock_for("abc"));
    EXPECT_EQ(table.get_stripe_count(), 8);

    TransferLockTable degenerate(0);
    EXPECT_EQ(degenerate.get_stripe_count(), 1);
}

TEST_F(TransferServiceTest, InitializeRelayTransfer) {
    Transfer transfer = init(250);
    EXPECT_EQ(transfer.status, TransferStatus::PENDING);
    EXPECT_EQ(transfer.total_chunks, 3);
    EXPECT_EQ(transfer.sender_id, "alice");
    EXPECT_FALSE(transfer.storage_path.empty());
    EXPECT_TRUE(blobs_->container_exists(transfer.id));
    EXPECT_TRUE(transfer.expires_at.has_value());

    auto stored = store_.get_transfer(transfer.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->storage_path, transfer.storage_path);
}

TEST_F(TransferServiceTest, InitializeP2pTransferHasNoStorage) {
    TransferResult result = service_->initialize_transfer("alice", make_request("r1", 250, "p2p"));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.transfer.mode, TransferMode::P2P);
    EXPECT_TRUE(result.transfer.storage_path.empty());
    EXPECT_FALSE(blobs_->container_exists(result.transfer.id));
    EXPECT_EQ(result.sender_name, "alice display");
}

TEST_F(TransferServiceTest, InitializeValidation) {
    EXPECT_EQ(service_->initialize_transfer("mallory", make_request("r1", 10)).outcome, Outcome::FORBIDDEN);
    EXPECT_EQ(service_->initialize_transfer("alice", make_request("missing", 10)).outcome, Outcome::NOT_FOUND);
    EXPECT_EQ(service_->initialize_transfer("alice", make_request("r1", 0)).outcome, Outcome::BAD_REQUEST);
    EXPECT_EQ(service_->initialize_transfer("alice", make_request("r1", 10001)).outcome, Outcome::BAD_REQUEST);
    EXPECT_EQ(service_->initialize_transfer("alice", make_request("r1", 10, "carrier")).outcome,
              Outcome::BAD_REQUEST);

    TransferRequest too_long = make_request("r1", 10);
    too_long.expires_in_hours = 169;
    EXPECT_EQ(service_->initialize_transfer("alice", too_long).outcome, Outcome::BAD_REQUEST);

    TransferRequest no_downloads = make_request("r1", 10);
    no_downloads.max_downloads = 0;
    EXPECT_EQ(service_->initialize_transfer("alice", no_downloads).outcome, Outcome::BAD_REQUEST);

    TransferRequest no_nonce = make_request("r1", 10);
    no_nonce.nonce.clear();
    EXPECT_EQ(service_->initialize_transfer("alice", no_nonce).outcome, Outcome::BAD_REQUEST);

    EXPECT_EQ(store_.transfer_count(), 0);
}

TEST_F(TransferServiceTest, RelayRejectedWhenRoomDisallows) {
    Room room = make_room("norelay");
    room.allow_relay = false;
    store_.insert_room(room);
    store_.upsert_member(make_member("norelay", "alice"));

    EXPECT_EQ(service_->initialize_transfer("alice", make_request("norelay", 10)).outcome, Outcome::BAD_REQUEST);
    EXPECT_TRUE(service_->initialize_transfer("alice", make_request("norelay", 10, "p2p")).ok());
}

TEST_F(TransferServiceTest, ExpiredRoomIsGone) {
    Room room = make_room("old");
    room.expires_at = Clock::now() - std::chrono::hours(1);
    store_.insert_room(room);
    store_.upsert_member(make_member("old", "alice"));
    EXPECT_EQ(service_->initialize_transfer("alice", make_request("old", 10)).outcome, Outcome::GONE);
}

TEST_F(TransferServiceTest, UploadProgressesToReady) {
    Transfer transfer = init(250);

    ChunkUploadResult first = service_->upload_chunk("alice", transfer.id, 0, make_bytes(100, 1));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.status, TransferStatus::UPLOADING);
    EXPECT_EQ(first.uploaded_chunks, 1);

    ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, 2, make_bytes(50, 3)).ok());
    ChunkUploadResult last = service_->upload_chunk("alice", transfer.id, 1, make_bytes(100, 2));
    ASSERT_TRUE(last.ok());
    EXPECT_EQ(last.status, TransferStatus::READY);
    EXPECT_EQ(last.uploaded_chunks, 3);
    EXPECT_EQ(store_.get_transfer(transfer.id)->status, TransferStatus::READY);

    nlohmann::json descriptor = TransferService::describe_chunk_upload(last);
    EXPECT_EQ(descriptor["status"], "ready");
    EXPECT_EQ(descriptor["chunk_index"], 1);
}

TEST_F(TransferServiceTest, ConcurrentChunkUploadsReachReadyOnce) {
    auto bob = std::make_shared<FakeTransport>("bob");
    ASSERT_TRUE(presence_.connect("r1", "bob", bob));

    Transfer transfer = init(1600);
    ASSERT_EQ(transfer.total_chunks, 16);

    const int thread_count = 4;
    std::atomic<int> ready_results(0);
    std::atomic<int> failures(0);
    std::vector<std::thread> uploaders;
    for (int t = 0; t < thread_count; ++t) {
        uploaders.emplace_back([&, t]() {
            for (uint32_t i = static_cast<uint32_t>(t); i < transfer.total_chunks; i += thread_count) {
                ChunkUploadResult result =
                    service_->upload_chunk("alice", transfer.id, i, make_bytes(100, static_cast<uint8_t>(i)));
                if (!result.ok()) {
                    failures++;
                } else if (result.status == TransferStatus::READY) {
                    ready_results++;
                }
            }
        });
    }
    for (auto& t : uploaders) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(ready_results.load(), 1);
    auto stored = store_.get_transfer(transfer.id);
    EXPECT_EQ(stored->uploaded_chunks, stored->total_chunks);
    EXPECT_EQ(stored->status, TransferStatus::READY);
    EXPECT_EQ(bob->sent_of_type("new_transfer").size(), 1);
}

TEST_F(TransferServiceTest, ReadyIsAnnouncedToRoom) {
    auto bob = std::make_shared<FakeTransport>("bob");
    ASSERT_TRUE(presence_.connect("r1", "bob", bob));

    Transfer transfer = init(150);
    ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, 0, make_bytes(100, 0)).ok());
    EXPECT_TRUE(bob->sent_of_type("new_transfer").empty());

    ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, 1, make_bytes(50, 0)).ok());
    auto announced = bob->sent_of_type("new_transfer");
    ASSERT_EQ(announced.size(), 1);
    EXPECT_EQ(announced[0]["transfer_id"], transfer.id);
    EXPECT_EQ(announced[0]["sender_name"], "alice display");
    EXPECT_EQ(announced[0]["file_size"], 150);
    EXPECT_EQ(announced[0]["status"], "ready");
}

TEST_F(TransferServiceTest, DuplicateChunkCountedOnce) {
    Transfer transfer = init(250);
    ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, 0, make_bytes(100, 1)).ok());

    ChunkUploadResult again = service_->upload_chunk("alice", transfer.id, 0, make_bytes(100, 9));
    ASSERT_TRUE(again.ok());
    EXPECT_TRUE(again.duplicate);
    EXPECT_EQ(again.uploaded_chunks, 1);
    EXPECT_EQ(again.status, TransferStatus::UPLOADING);

    std::vector<uint8_t> stored;
    ASSERT_TRUE(blobs_->read_chunk(transfer.id, 0, stored));
    EXPECT_EQ(stored, make_bytes(100, 9));
}

TEST_F(TransferServiceTest, UploadValidation) {
    Transfer transfer = init(250);
    EXPECT_EQ(service_->upload_chunk("alice", "missing", 0, make_bytes(10, 0)).outcome, Outcome::NOT_FOUND);
    EXPECT_EQ(service_->upload_chunk("bob", transfer.id, 0, make_bytes(10, 0)).outcome, Outcome::FORBIDDEN);
    EXPECT_EQ(service_->upload_chunk("alice", transfer.id, 3, make_bytes(10, 0)).outcome, Outcome::BAD_REQUEST);
    EXPECT_EQ(service_->upload_chunk("alice", transfer.id, -1, make_bytes(10, 0)).outcome, Outcome::BAD_REQUEST);
    EXPECT_EQ(service_->upload_chunk("alice", transfer.id, 0, {}).outcome, Outcome::BAD_REQUEST);
    EXPECT_EQ(service_->upload_chunk("alice", transfer.id, 0, make_bytes(101, 0)).outcome, Outcome::BAD_REQUEST);

    TransferResult p2p = service_->initialize_transfer("alice", make_request("r1", 50, "p2p"));
    ASSERT_TRUE(p2p.ok());
    EXPECT_EQ(service_->upload_chunk("alice", p2p.transfer.id, 0, make_bytes(50, 0)).outcome,
              Outcome::BAD_REQUEST);

    EXPECT_EQ(store_.get_transfer(transfer.id)->uploaded_chunks, 0);
}

TEST_F(TransferServiceTest, UploadAfterReadyConflicts) {
    Transfer transfer = init(50);
    ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, 0, make_bytes(50, 0)).ok());
    EXPECT_EQ(service_->upload_chunk("alice", transfer.id, 0, make_bytes(50, 0)).outcome, Outcome::CONFLICT);
}

TEST_F(TransferServiceTest, UploadToDeactivatedRoomConflicts) {
    Transfer transfer = init(250);
    store_.update_room("r1", [](Room& room) {
        room.is_active = false;
        return true;
    });
    EXPECT_EQ(service_->upload_chunk("alice", transfer.id, 0, make_bytes(100, 0)).outcome, Outcome::CONFLICT);
}

TEST_F(TransferServiceTest, DownloadReturnsConcatenatedBytesAndCompletes) {
    auto payload = make_bytes(250, 5);
    Transfer transfer = init(250, 2);
    upload_all(transfer, payload);

    DownloadResult first = service_->download("bob", transfer.id);
    ASSERT_TRUE(first.ok()) << first.error_message;
    EXPECT_EQ(first.data, payload);
    EXPECT_EQ(first.nonce, "NONCE");
    EXPECT_EQ(first.download_count, 1);
    EXPECT_EQ(first.status, TransferStatus::READY);

    DownloadResult second = service_->download("alice", transfer.id);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.status, TransferStatus::COMPLETED);
    EXPECT_TRUE(store_.get_transfer(transfer.id)->completed_at.has_value());

    DownloadResult third = service_->download("bob", transfer.id);
    EXPECT_EQ(third.outcome, Outcome::GONE);
    EXPECT_EQ(store_.get_transfer(transfer.id)->download_count, 2);
}

TEST_F(TransferServiceTest, DownloadBeforeReadyIsNotReady) {
    Transfer transfer = init(250);
    ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, 0, make_bytes(100, 0)).ok());
    DownloadResult result = service_->download("bob", transfer.id);
    EXPECT_EQ(result.outcome, Outcome::NOT_READY);
    EXPECT_EQ(outcome_to_http_status(result.outcome), 400);
}

TEST_F(TransferServiceTest, DownloadRequiresMembership) {
    Transfer transfer = init(50);
    EXPECT_EQ(service_->download("mallory", transfer.id).outcome, Outcome::FORBIDDEN);
    EXPECT_EQ(service_->download("bob", "missing").outcome, Outcome::NOT_FOUND);
}

TEST_F(TransferServiceTest, ExpiredTransferIsGone) {
    Transfer transfer = init(50);
    ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, 0, make_bytes(50, 0)).ok());
    store_.update_transfer(transfer.id, [](Transfer& t) {
        t.expires_at = Clock::now() - std::chrono::seconds(1);
        return true;
    });
    EXPECT_EQ(service_->download("bob", transfer.id).outcome, Outcome::GONE);
}

TEST_F(TransferServiceTest, ConcurrentDownloadsNeverExceedLimit) {
    Transfer transfer = init(50, 3);
    ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, 0, make_bytes(50, 0)).ok());

    std::atomic<int> successes(0);
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&]() {
            if (service_->download("bob", transfer.id).ok()) {
                successes++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(successes.load(), 3);
    EXPECT_EQ(store_.get_transfer(transfer.id)->download_count, 3);
    EXPECT_EQ(store_.get_transfer(transfer.id)->status, TransferStatus::COMPLETED);
}

TEST_F(TransferServiceTest, CancelDeletesStorage) {
    Transfer transfer = init(250);
    ASSERT_TRUE(service_->upload_chunk("alice", transfer.id, 0, make_bytes(100, 0)).ok());

    EXPECT_EQ(service_->cancel_transfer("bob", transfer.id).outcome, Outcome::FORBIDDEN);

    TransferResult cancelled = service_->cancel_transfer("alice", transfer.id);
    ASSERT_TRUE(cancelled.ok());
    EXPECT_EQ(cancelled.transfer.status, TransferStatus::CANCELLED);
    EXPECT_TRUE(cancelled.transfer.storage_path.empty());
    EXPECT_FALSE(blobs_->container_exists(transfer.id));

    EXPECT_EQ(service_->cancel_transfer("alice", transfer.id).outcome, Outcome::CONFLICT);
    EXPECT_EQ(service_->upload_chunk("alice", transfer.id, 1, make_bytes(100, 0)).outcome, Outcome::CONFLICT);
    EXPECT_EQ(service_->download("bob", transfer.id).outcome, Outcome::NOT_READY);
}

TEST_F(TransferServiceTest, GetAndListTransfers) {
    Transfer first = init(50);
    Transfer second = init(60);

    TransferResult fetched = service_->get_transfer("bob", first.id);
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched.sender_name, "alice display");
    EXPECT_EQ(service_->get_transfer("mallory", first.id).outcome, Outcome::FORBIDDEN);

    TransferListResult listed = service_->list_room_transfers("bob", "r1");
    ASSERT_TRUE(listed.ok());
    ASSERT_EQ(listed.transfers.size(), 2);
    EXPECT_EQ(service_->list_room_transfers("mallory", "r1").outcome, Outcome::FORBIDDEN);

    nlohmann::json descriptor = TransferService::describe_transfer(second, "alice display");
    EXPECT_EQ(descriptor["mode"], "relay");
    EXPECT_EQ(descriptor["status"], "pending");
    EXPECT_TRUE(descriptor["encrypted_mimetype"].is_null());
    EXPECT_EQ(descriptor["max_downloads"], 1);
}

//=============================================================================
// Storage failures
//=============================================================================

class TransferServiceStorageFailureTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_.insert_room(make_room("r1"));
        store_.upsert_member(make_member("r1", "alice"));
        store_.upsert_member(make_member("r1", "bob"));

        ON_CALL(blobs_, create_container(_, _))
            .WillByDefault(DoAll(SetArgReferee<1>(std::string("mock://container")), Return(true)));
        ON_CALL(blobs_, write_chunk(_, _, _)).WillByDefault(Return(true));
        ON_CALL(blobs_, read_chunk(_, _, _)).WillByDefault(Return(true));
        ON_CALL(blobs_, delete_container(_)).WillByDefault(Return(true));
    }

    MemoryRecordStore store_;
    PresenceRegistry presence_{store_};
    TransferLockTable locks_;
    NiceMock<MockBlobStore> blobs_;
    TransferService service_{store_, blobs_, presence_, locks_, small_chunk_settings()};
};

TEST_F(TransferServiceStorageFailureTest, ContainerFailureRollsBackRecord) {
    EXPECT_CALL(blobs_, create_container(_, _)).WillOnce(Return(false));
    TransferResult result = service_.initialize_transfer("alice", make_request("r1", 50));
    EXPECT_EQ(result.outcome, Outcome::STORAGE_FAILURE);
    EXPECT_EQ(store_.transfer_count(), 0);
}

TEST_F(TransferServiceStorageFailureTest, ChunkWriteFailureLeavesStateUnchanged) {
    TransferResult init = service_.initialize_transfer("alice", make_request("r1", 150));
    ASSERT_TRUE(init.ok());
    EXPECT_EQ(init.transfer.storage_path, "mock://container");

    EXPECT_CALL(blobs_, write_chunk(init.transfer.id, 0u, _)).WillOnce(Return(false));
    ChunkUploadResult result = service_.upload_chunk("alice", init.transfer.id, 0, make_bytes(100, 0));
    EXPECT_EQ(result.outcome, Outcome::STORAGE_FAILURE);

    auto stored = store_.get_transfer(init.transfer.id);
    EXPECT_EQ(stored->status, TransferStatus::PENDING);
    EXPECT_EQ(stored->uploaded_chunks, 0);
}

TEST_F(TransferServiceStorageFailureTest, ReadFailureDoesNotCountDownload) {
    TransferResult init = service_.initialize_transfer("alice", make_request("r1", 50));
    ASSERT_TRUE(init.ok());
    ASSERT_TRUE(service_.upload_chunk("alice", init.transfer.id, 0, make_bytes(50, 0)).ok());

    EXPECT_CALL(blobs_, read_chunk(init.transfer.id, 0u, _)).WillOnce(Return(false));
    EXPECT_EQ(service_.download("bob", init.transfer.id).outcome, Outcome::STORAGE_FAILURE);
    EXPECT_EQ(store_.get_transfer(init.transfer.id)->download_count, 0);
}

TEST_F(TransferServiceStorageFailureTest, CancelKeepsTransferWhenDeleteFails) {
    TransferResult init = service_.initialize_transfer("alice", make_request("r1", 50));
    ASSERT_TRUE(init.ok());

    EXPECT_CALL(blobs_, delete_container(init.transfer.id)).WillOnce(Return(false));
    EXPECT_EQ(service_.cancel_transfer("alice", init.transfer.id).outcome, Outcome::STORAGE_FAILURE);
    EXPECT_EQ(store_.get_transfer(init.transfer.id)->status, TransferStatus::PENDING);
}

TEST_F(TransferServiceStorageFailureTest, P2pCancelNeverTouchesStorage) {
    TransferResult init = service_.initialize_transfer("alice", make_request("r1", 50, "p2p"));
    ASSERT_TRUE(init.ok());

    EXPECT_CALL(blobs_, delete_container(_)).Times(0);
    EXPECT_TRUE(service_.cancel_transfer("alice", init.transfer.id).ok());
}
