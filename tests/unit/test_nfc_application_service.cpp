/**
 * @file test_nfc_application_service.cpp
 * @brief Integration-style tests for NfcApplicationService over the mock reader
 */

#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include "fakes/FakePlaylistSyncPort.hpp"
#include "nfcassociation/application/service/NfcApplicationService.hpp"
#include "nfcassociation/domain/exception/NfcExceptions.hpp"
#include "nfcassociation/infrastructure/adapter/MockNfcHardwareAdapter.hpp"
#include "nfcassociation/infrastructure/repository/InMemoryNfcTagRepository.hpp"

using namespace nfcassociation::domain::model;
using namespace nfcassociation::domain::exception;
using nfcassociation::application::service::NfcApplicationService;
using nfcassociation::application::service::NfcEventDispatcher;
using nfcassociation::domain::service::AssociationService;
using nfcassociation::infrastructure::adapter::MockNfcHardwareAdapter;
using nfcassociation::infrastructure::repository::InMemoryNfcTagRepository;
using testing_fakes::FakePlaylistSyncPort;

namespace {

class NfcApplicationServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        hardware_ = std::make_shared<MockNfcHardwareAdapter>();
        sync_ = std::make_shared<FakePlaylistSyncPort>();
        associationService_ = std::make_shared<AssociationService>(
            std::make_shared<InMemoryNfcTagRepository>(), sync_);

        NfcApplicationService::Options options;
        options.maxTimeoutSeconds = 300;
        options.cleanupInterval = std::chrono::milliseconds(50);
        service_ = std::make_unique<NfcApplicationService>(
            hardware_, associationService_, std::make_shared<NfcEventDispatcher>(), options);

        service_->registerTagDetectedCallback([this](const std::string& uid) {
            playbackUids_.push_back(uid);
        });
        service_->registerAssociationCallback([this](const DetectionResult& result) {
            results_.push_back(result);
        });
    }

    void TearDown() override {
        if (service_->isRunning()) {
            service_->stopSystem();
        }
    }

    void scan(const std::string& uid) {
        ASSERT_TRUE(hardware_->simulateTagDetection(uid));
        service_->waitForPendingDetections();
    }

    std::shared_ptr<MockNfcHardwareAdapter> hardware_;
    std::shared_ptr<FakePlaylistSyncPort> sync_;
    std::shared_ptr<AssociationService> associationService_;
    std::unique_ptr<NfcApplicationService> service_;

    // Written on the worker thread, read after waitForPendingDetections
    std::vector<std::string> playbackUids_;
    std::vector<DetectionResult> results_;
};

// --- Lifecycle ---

TEST_F(NfcApplicationServiceTest, StartAndStopSystem) {
    service_->startSystem();
    EXPECT_TRUE(service_->isRunning());
    EXPECT_TRUE(hardware_->isDetecting());

    service_->startSystem();  // idempotent
    EXPECT_TRUE(service_->isRunning());

    service_->stopSystem();
    EXPECT_FALSE(service_->isRunning());
    EXPECT_FALSE(hardware_->isDetecting());
}

TEST_F(NfcApplicationServiceTest, HardwareStartFailurePropagates) {
    hardware_->setStartFailure(std::string("reader not connected"));

    EXPECT_THROW(service_->startSystem(), HardwareError);
    EXPECT_FALSE(service_->isRunning());
}

TEST_F(NfcApplicationServiceTest, HardwareStopFailurePropagates) {
    service_->startSystem();
    hardware_->setStopFailure(std::string("reader busy"));

    EXPECT_THROW(service_->stopSystem(), HardwareError);
    EXPECT_FALSE(service_->isRunning());
    hardware_->setStopFailure(std::nullopt);
}

// --- Detection routing ---

TEST_F(NfcApplicationServiceTest, DetectionWithoutSessionTriggersPlayback) {
    service_->startSystem();

    scan("ABCD1234EF");

    ASSERT_EQ(playbackUids_.size(), 1u);
    EXPECT_EQ(playbackUids_[0], "ABCD1234EF");
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].action, DetectionAction::TAG_DETECTED);
    EXPECT_EQ(results_[0].tagId, "abcd1234ef");
}

TEST_F(NfcApplicationServiceTest, DetectionDuringSessionAssociatesWithoutPlayback) {
    service_->startSystem();
    service_->startAssociationUseCase("p1", 60);

    scan("04:F7:ED:A4:DF:61:81");

    EXPECT_TRUE(playbackUids_.empty());
    ASSERT_EQ(results_.size(), 1u);
    EXPECT_EQ(results_[0].action, DetectionAction::ASSOCIATION_SUCCESS);
    EXPECT_EQ(sync_->bindings["p1"], "04f7eda4df6181");

    // Session finished, the next scan plays the bound playlist
    scan("04:F7:ED:A4:DF:61:81");
    ASSERT_EQ(playbackUids_.size(), 1u);
    EXPECT_EQ(playbackUids_[0], "04:F7:ED:A4:DF:61:81");
    EXPECT_EQ(results_[1].associatedPlaylistId, "p1");
}

TEST_F(NfcApplicationServiceTest, InvalidUidIsDropped) {
    service_->startSystem();

    scan("mock_tag_001");

    EXPECT_TRUE(playbackUids_.empty());
    EXPECT_TRUE(results_.empty());
}

TEST_F(NfcApplicationServiceTest, DetectionsAreProcessedInArrivalOrder) {
    service_->startSystem();
    service_->startAssociationUseCase("p1", 60);

    hardware_->simulateTagDetection("aaaa0001");
    hardware_->simulateTagDetection("aaaa0002");
    service_->waitForPendingDetections();

    ASSERT_EQ(results_.size(), 2u);
    EXPECT_EQ(results_[0].tagId, "aaaa0001");
    EXPECT_EQ(results_[0].action, DetectionAction::ASSOCIATION_SUCCESS);
    EXPECT_EQ(results_[1].tagId, "aaaa0002");
    EXPECT_EQ(results_[1].action, DetectionAction::TAG_DETECTED);
}

TEST_F(NfcApplicationServiceTest, PlaybackStaysSuppressedWhenSessionEndsBeforeProcessing) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> first{true};
    service_->registerAssociationCallback([&entered, released, &first](const DetectionResult&) {
        if (first.exchange(false)) {
            entered.set_value();
            released.wait();
        }
    });
    service_->startSystem();

    // Hold the worker inside the first detection
    ASSERT_TRUE(hardware_->simulateTagDetection("aaaa0001"));
    entered.get_future().wait();

    auto response = service_->startAssociationUseCase("p1", 60);
    ASSERT_TRUE(hardware_->simulateTagDetection("bbbb0002"));
    EXPECT_TRUE(service_->stopAssociationUseCase(response.session.sessionId));

    release.set_value();
    service_->waitForPendingDetections();

    EXPECT_EQ(playbackUids_, std::vector<std::string>{"aaaa0001"});
    ASSERT_EQ(results_.size(), 2u);
    EXPECT_EQ(results_[1].tagId, "bbbb0002");
    EXPECT_EQ(results_[1].action, DetectionAction::TAG_DETECTED);
}

// --- Use cases ---

TEST_F(NfcApplicationServiceTest, StartUseCaseAppliesDefaultTimeout) {
    auto response = service_->startAssociationUseCase("p1");

    EXPECT_EQ(response.session.timeoutSeconds, 60);
    EXPECT_EQ(response.session.state, "LISTENING");
    EXPECT_TRUE(response.toJson()["success"].asBool());
}

TEST_F(NfcApplicationServiceTest, StartUseCaseRejectsExcessiveTimeout) {
    EXPECT_THROW(service_->startAssociationUseCase("p1", 301), ValidationError);
    EXPECT_NO_THROW(service_->startAssociationUseCase("p1", 300));
}

TEST_F(NfcApplicationServiceTest, SessionLookupAndStop) {
    auto response = service_->startAssociationUseCase("p1", 60);
    const auto& id = response.session.sessionId;

    EXPECT_EQ(service_->getSessionUseCase(id).state, "LISTENING");
    EXPECT_TRUE(service_->stopAssociationUseCase(id));
    EXPECT_FALSE(service_->stopAssociationUseCase(id));
    EXPECT_EQ(service_->getSessionUseCase(id).state, "STOPPED");
}

TEST_F(NfcApplicationServiceTest, UnknownSessionIsNotFound) {
    EXPECT_THROW(service_->getSessionUseCase(SessionId::generate().toString()), NotFoundError);
    EXPECT_THROW(service_->stopAssociationUseCase("not-a-session"), NotFoundError);
}

TEST_F(NfcApplicationServiceTest, StatusReportsSessionsAndHardware) {
    service_->startSystem();
    service_->startAssociationUseCase("p1", 60);

    auto status = service_->getStatusUseCase();
    auto json = status.toJson();

    EXPECT_EQ(json["activeSessionCount"].asInt(), 1);
    EXPECT_TRUE(json["systemRunning"].asBool());
    EXPECT_TRUE(json["detecting"].asBool());
    EXPECT_TRUE(json["playlistSyncAvailable"].asBool());
    EXPECT_EQ(json["hardware"]["hardwareType"].asString(), "mock");
}

TEST_F(NfcApplicationServiceTest, DissociateUseCase) {
    service_->startSystem();
    service_->startAssociationUseCase("p1", 60);
    scan("abcd1234");

    EXPECT_TRUE(service_->dissociateUseCase("AB:CD:12:34"));
    EXPECT_FALSE(associationService_->findTag(TagIdentifier::of("abcd1234"))->isAssociated());

    EXPECT_THROW(service_->dissociateUseCase("ffff0000"), NotFoundError);
    EXPECT_THROW(service_->dissociateUseCase("zz"), ValidationError);
}

} // namespace
