/**
 * @file test_association_service.cpp
 * @brief Unit tests for AssociationService (sessions, conflicts, override, sync)
 */

#include <gtest/gtest.h>
#include <future>
#include <thread>
#include "fakes/FakePlaylistSyncPort.hpp"
#include "nfcassociation/domain/exception/NfcExceptions.hpp"
#include "nfcassociation/domain/service/AssociationService.hpp"
#include "nfcassociation/infrastructure/repository/InMemoryNfcTagRepository.hpp"

using namespace nfcassociation::domain::model;
using namespace nfcassociation::domain::exception;
using nfcassociation::domain::service::AssociationService;
using nfcassociation::infrastructure::repository::InMemoryNfcTagRepository;
using testing_fakes::FakePlaylistSyncPort;
using namespace std::chrono_literals;

namespace {

constexpr const char* kTag = "04f7eda4df6181";

/** Repository whose writes fail, for the processing-error path */
class FailingSaveRepository : public InMemoryNfcTagRepository {
public:
    void save(const NfcTag&) override {
        throw shared::exception::InfrastructureException("DB_QUERY_FAILED", "disk full");
    }
};

class AssociationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository_ = std::make_shared<InMemoryNfcTagRepository>();
        sync_ = std::make_shared<FakePlaylistSyncPort>();
        service_ = makeService(sync_);
    }

    std::unique_ptr<AssociationService> makeService(std::shared_ptr<FakePlaylistSyncPort> sync,
                                                    size_t historyLimit = 256) {
        return std::make_unique<AssociationService>(
            repository_, std::move(sync), [this] { return now_; }, historyLimit);
    }

    DetectionResult detect(const std::string& uid = kTag,
                           const std::optional<SessionId>& hint = std::nullopt) {
        return service_->processTagDetection(TagIdentifier::of(uid), hint);
    }

    std::chrono::system_clock::time_point now_ =
        std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
    std::shared_ptr<InMemoryNfcTagRepository> repository_;
    std::shared_ptr<FakePlaylistSyncPort> sync_;
    std::unique_ptr<AssociationService> service_;
};

// --- Starting sessions ---

TEST_F(AssociationServiceTest, StartRegistersListeningSession) {
    auto session = service_->startAssociationSession("p1", 60);

    EXPECT_EQ(session.getState(), AssociationState::LISTENING);
    EXPECT_TRUE(service_->hasActiveSessions());
    ASSERT_EQ(service_->getActiveSessions().size(), 1u);
    EXPECT_EQ(service_->getActiveSessions().front().getPlaylistId(), "p1");
}

TEST_F(AssociationServiceTest, StartRejectsInvalidInput) {
    EXPECT_THROW(service_->startAssociationSession("", 60), ValidationError);
    EXPECT_THROW(service_->startAssociationSession("   ", 60), ValidationError);
    EXPECT_THROW(service_->startAssociationSession("p1", 0), ValidationError);
    EXPECT_THROW(service_->startAssociationSession("p1", -5), ValidationError);
    EXPECT_FALSE(service_->hasActiveSessions());
}

TEST_F(AssociationServiceTest, SecondSessionForSamePlaylistConflicts) {
    service_->startAssociationSession("p1", 60);

    EXPECT_THROW(service_->startAssociationSession("p1", 60), ConflictError);
    EXPECT_THROW(service_->startAssociationSession("p1", 60, true), ConflictError);
    EXPECT_EQ(service_->getActiveSessions().size(), 1u);
}

TEST_F(AssociationServiceTest, ExpiredSessionDoesNotBlockNewOne) {
    service_->startAssociationSession("p1", 1);
    now_ += 2s;

    EXPECT_NO_THROW(service_->startAssociationSession("p1", 60));
}

TEST_F(AssociationServiceTest, DifferentPlaylistsHaveIndependentSessions) {
    auto first = service_->startAssociationSession("p1", 60);
    auto second = service_->startAssociationSession("p2", 60);

    EXPECT_NE(first.getSessionId(), second.getSessionId());
    EXPECT_EQ(service_->getActiveSessions().size(), 2u);

    EXPECT_TRUE(service_->stopAssociationSession(first.getSessionId()));
    ASSERT_EQ(service_->getActiveSessions().size(), 1u);
    EXPECT_EQ(service_->getActiveSessions().front().getSessionId(), second.getSessionId());
}

// --- Detection without a session ---

TEST_F(AssociationServiceTest, DetectionWithoutSessionOnlyRecordsTag) {
    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::TAG_DETECTED);
    EXPECT_TRUE(result.noActiveSessions);
    EXPECT_FALSE(result.associatedPlaylistId.has_value());

    auto tag = service_->findTag(TagIdentifier::of(kTag));
    ASSERT_TRUE(tag.has_value());
    EXPECT_EQ(tag->getDetectionCount(), 1);
    EXPECT_FALSE(tag->isAssociated());
    EXPECT_TRUE(sync_->updates.empty());
}

TEST_F(AssociationServiceTest, DetectionWithoutSessionReportsExistingBinding) {
    service_->startAssociationSession("p1", 60);
    detect();

    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::TAG_DETECTED);
    EXPECT_EQ(result.associatedPlaylistId, "p1");
}

// --- Association ---

TEST_F(AssociationServiceTest, DetectionBindsTagToSessionPlaylist) {
    auto session = service_->startAssociationSession("p1", 60);

    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::ASSOCIATION_SUCCESS);
    EXPECT_TRUE(result.playlistSynced);
    EXPECT_EQ(result.sessionId, session.getSessionId().toString());
    EXPECT_EQ(result.sessionState, AssociationState::SUCCESS);

    auto tag = service_->findTag(TagIdentifier::of(kTag));
    ASSERT_TRUE(tag.has_value());
    EXPECT_TRUE(tag->isAssociatedWith("p1"));

    ASSERT_EQ(sync_->updates.size(), 1u);
    EXPECT_EQ(sync_->updates[0].first, "p1");
    EXPECT_EQ(sync_->updates[0].second, kTag);

    auto stored = service_->findSession(session.getSessionId());
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->getState(), AssociationState::SUCCESS);
    ASSERT_TRUE(stored->getDetectedTag().has_value());
    EXPECT_EQ(stored->getDetectedTag()->getUid(), kTag);
    EXPECT_FALSE(service_->hasActiveSessions());
}

TEST_F(AssociationServiceTest, SeparatedUidIsNormalizedBeforeBinding) {
    service_->startAssociationSession("p1", 60);

    auto result = detect("04:F7:ED:A4:DF:61:81");

    EXPECT_EQ(result.tagId, kTag);
    EXPECT_TRUE(service_->findTag(TagIdentifier::of(kTag))->isAssociatedWith("p1"));
}

TEST_F(AssociationServiceTest, RebindingToSamePlaylistSucceeds) {
    service_->startAssociationSession("p1", 60);
    detect();
    service_->startAssociationSession("p1", 60);

    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::ASSOCIATION_SUCCESS);
    EXPECT_FALSE(result.previousPlaylistId.has_value());
    EXPECT_TRUE(sync_->removals.empty());
}

TEST_F(AssociationServiceTest, TagBoundElsewhereIsDuplicate) {
    service_->startAssociationSession("p1", 60);
    detect();
    auto session = service_->startAssociationSession("p2", 60);

    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::DUPLICATE_ASSOCIATION);
    EXPECT_EQ(result.existingPlaylistId, "p1");
    EXPECT_EQ(result.sessionState, AssociationState::DUPLICATE);

    auto tag = service_->findTag(TagIdentifier::of(kTag));
    EXPECT_TRUE(tag->isAssociatedWith("p1"));
    EXPECT_EQ(tag->getDetectionCount(), 2);
    EXPECT_EQ(sync_->updates.size(), 1u);

    auto stored = service_->findSession(session.getSessionId());
    EXPECT_EQ(stored->getConflictPlaylistId(), "p1");
}

TEST_F(AssociationServiceTest, OverrideMovesTag) {
    service_->startAssociationSession("p1", 60);
    detect();
    service_->startAssociationSession("p2", 60, true);

    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::ASSOCIATION_SUCCESS);
    EXPECT_EQ(result.previousPlaylistId, "p1");
    EXPECT_TRUE(service_->findTag(TagIdentifier::of(kTag))->isAssociatedWith("p2"));

    ASSERT_EQ(sync_->removals.size(), 1u);
    EXPECT_EQ(sync_->removals[0], kTag);
    EXPECT_EQ(sync_->bindings["p2"], kTag);
    EXPECT_EQ(sync_->bindings["p1"], "");
}

TEST_F(AssociationServiceTest, HintSelectsSession) {
    service_->startAssociationSession("p1", 60);
    auto second = service_->startAssociationSession("p2", 60);

    auto result = detect(kTag, second.getSessionId());

    EXPECT_EQ(result.playlistId, "p2");
    EXPECT_EQ(service_->getActiveSessions().size(), 1u);
    EXPECT_EQ(service_->getActiveSessions().front().getPlaylistId(), "p1");
}

TEST_F(AssociationServiceTest, UnknownHintFallsBackToOldestSession) {
    service_->startAssociationSession("p1", 60);
    service_->startAssociationSession("p2", 60);

    auto result = detect(kTag, SessionId::generate());

    EXPECT_EQ(result.playlistId, "p1");
}

// --- Failure handling ---

TEST_F(AssociationServiceTest, SyncRejectionFailsAssociation) {
    sync_->updateResult = false;
    auto session = service_->startAssociationSession("p1", 60);

    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::ASSOCIATION_FAILED);
    EXPECT_FALSE(result.playlistSynced);
    EXPECT_EQ(result.sessionState, AssociationState::ERROR);
    ASSERT_TRUE(result.errorMessage.has_value());

    // Tag store keeps the binding
    EXPECT_TRUE(service_->findTag(TagIdentifier::of(kTag))->isAssociatedWith("p1"));
    EXPECT_TRUE(service_->findSession(session.getSessionId())->getErrorMessage().has_value());
}

TEST_F(AssociationServiceTest, SyncExceptionFailsAssociation) {
    sync_->throwOnUpdate = true;
    service_->startAssociationSession("p1", 60);

    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::ASSOCIATION_FAILED);
    EXPECT_NE(result.errorMessage->find("playlist store unreachable"), std::string::npos);
}

TEST_F(AssociationServiceTest, RepositoryFailureIsCapturedOnSession) {
    repository_ = std::make_shared<FailingSaveRepository>();
    service_ = makeService(sync_);
    auto session = service_->startAssociationSession("p1", 60);

    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::ASSOCIATION_ERROR);
    EXPECT_EQ(result.sessionState, AssociationState::ERROR);
    EXPECT_EQ(result.errorMessage, "disk full");
    EXPECT_EQ(service_->findSession(session.getSessionId())->getState(), AssociationState::ERROR);
}

TEST_F(AssociationServiceTest, WorksWithoutPlaylistSync) {
    service_ = makeService(nullptr);
    service_->startAssociationSession("p1", 60);

    auto result = detect();

    EXPECT_FALSE(service_->hasPlaylistSync());
    EXPECT_EQ(result.action, DetectionAction::ASSOCIATION_SUCCESS);
    EXPECT_FALSE(result.playlistSynced);
    EXPECT_TRUE(service_->findTag(TagIdentifier::of(kTag))->isAssociatedWith("p1"));
}

TEST(AssociationServiceConstructionTest, RequiresRepository) {
    EXPECT_THROW(AssociationService(nullptr, nullptr), std::invalid_argument);
}

// --- Stop and timeout ---

TEST_F(AssociationServiceTest, StopIsIdempotent) {
    auto session = service_->startAssociationSession("p1", 60);

    EXPECT_TRUE(service_->stopAssociationSession(session.getSessionId()));
    EXPECT_FALSE(service_->stopAssociationSession(session.getSessionId()));
    EXPECT_FALSE(service_->stopAssociationSession(SessionId::generate()));
    EXPECT_EQ(service_->findSession(session.getSessionId())->getState(), AssociationState::STOPPED);
}

TEST_F(AssociationServiceTest, StopAfterCompletionReturnsFalse) {
    auto session = service_->startAssociationSession("p1", 60);
    detect();

    EXPECT_FALSE(service_->stopAssociationSession(session.getSessionId()));
    EXPECT_EQ(service_->findSession(session.getSessionId())->getState(), AssociationState::SUCCESS);
}

TEST_F(AssociationServiceTest, CleanupTimesOutExpiredSessions) {
    auto session = service_->startAssociationSession("p1", 1);
    service_->startAssociationSession("p2", 60);
    now_ += 2s;

    EXPECT_EQ(service_->cleanupExpiredSessions(), 1);
    EXPECT_EQ(service_->cleanupExpiredSessions(), 0);
    EXPECT_EQ(service_->findSession(session.getSessionId())->getState(), AssociationState::TIMEOUT);
    EXPECT_EQ(service_->getActiveSessions().size(), 1u);
}

TEST_F(AssociationServiceTest, ExpiredSessionIgnoresDetectionBeforeSweep) {
    service_->startAssociationSession("p1", 1);
    now_ += 1s;

    auto result = detect();

    EXPECT_EQ(result.action, DetectionAction::TAG_DETECTED);
    EXPECT_FALSE(service_->findTag(TagIdentifier::of(kTag))->isAssociated());
}

TEST_F(AssociationServiceTest, ExpiredSessionReportsTimeoutBeforeSweep) {
    auto session = service_->startAssociationSession("p1", 1);
    now_ += 5s;

    EXPECT_TRUE(service_->getActiveSessions().empty());
    EXPECT_FALSE(service_->hasActiveSessions());
    auto found = service_->findSession(session.getSessionId());
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->getState(), AssociationState::TIMEOUT);
    EXPECT_FALSE(service_->stopAssociationSession(session.getSessionId()));
    EXPECT_EQ(service_->cleanupExpiredSessions(), 0);
}

TEST_F(AssociationServiceTest, SessionClaimedByDetectionCannotBeStoppedOrExpired) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    sync_->beforeUpdate = [&entered, released] {
        entered.set_value();
        released.wait();
    };

    auto session = service_->startAssociationSession("p1", 1);
    DetectionResult result;
    std::thread detection([this, &result] { result = detect(); });
    entered.get_future().wait();

    EXPECT_FALSE(service_->stopAssociationSession(session.getSessionId()));

    now_ += 5s;
    EXPECT_EQ(service_->cleanupExpiredSessions(), 0);
    EXPECT_EQ(service_->findSession(session.getSessionId())->getState(), AssociationState::LISTENING);
    EXPECT_THROW(service_->startAssociationSession("p1", 60), ConflictError);

    release.set_value();
    detection.join();
    sync_->beforeUpdate = nullptr;

    EXPECT_EQ(result.action, DetectionAction::ASSOCIATION_SUCCESS);
    EXPECT_EQ(service_->findSession(session.getSessionId())->getState(), AssociationState::SUCCESS);
    EXPECT_TRUE(service_->getActiveSessions().empty());
}

TEST_F(AssociationServiceTest, TerminalHistoryIsBounded) {
    service_ = makeService(sync_, 2);
    std::vector<SessionId> ids;
    for (int i = 0; i < 3; ++i) {
        auto session = service_->startAssociationSession("p" + std::to_string(i), 60);
        service_->stopAssociationSession(session.getSessionId());
        ids.push_back(session.getSessionId());
    }

    EXPECT_FALSE(service_->findSession(ids[0]).has_value());
    EXPECT_TRUE(service_->findSession(ids[1]).has_value());
    EXPECT_TRUE(service_->findSession(ids[2]).has_value());
}

// --- Dissociation ---

TEST_F(AssociationServiceTest, DissociateClearsBothSides) {
    service_->startAssociationSession("p1", 60);
    detect();

    EXPECT_TRUE(service_->dissociateTag(TagIdentifier::of(kTag)));

    EXPECT_FALSE(service_->findTag(TagIdentifier::of(kTag))->isAssociated());
    ASSERT_EQ(sync_->removals.size(), 1u);
    EXPECT_FALSE(sync_->findByNfcTag(kTag).has_value());
}

TEST_F(AssociationServiceTest, DissociateUnknownTagReturnsFalse) {
    EXPECT_FALSE(service_->dissociateTag(TagIdentifier::of("deadbeef")));
}

TEST_F(AssociationServiceTest, DissociateSurvivesSyncFailure) {
    service_->startAssociationSession("p1", 60);
    detect();
    sync_->removeResult = false;

    EXPECT_TRUE(service_->dissociateTag(TagIdentifier::of(kTag)));
    EXPECT_FALSE(service_->findTag(TagIdentifier::of(kTag))->isAssociated());
}

} // namespace
