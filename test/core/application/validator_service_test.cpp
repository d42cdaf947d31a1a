/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <thread>

#include "application/validator_service.hpp"
#include "application/validator_state.hpp"
#include "mock/application/app_configuration_mock.hpp"
#include "mock/clock/clock_mock.hpp"
#include "mock/network/miner_client_mock.hpp"
#include "mock/network/participant_table_mock.hpp"
#include "mock/storage/state_store_mock.hpp"
#include "mock/validator/uniform_draw_mock.hpp"
#include "storage/impl/file_state_store.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "validator/trust_state.hpp"

using namespace vigil;
using application::AppConfigurationMock;
using application::ValidatorService;
using application::ValidatorServiceError;
using application::ValidatorState;
using network::MinerClient;
using network::MinerClientError;
using network::MinerClientMock;
using network::Participant;
using network::ParticipantTableMock;
using storage::FileStateStore;
using validator::MinerTrustState;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;

class ValidatorServiceTest : public ::testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    base_path_ = std::filesystem::temp_directory_path() / "vigil_service_test"
               / ::testing::UnitTest::GetInstance()->current_test_info()->name();
    std::filesystem::remove_all(base_path_);

    ON_CALL(config_, basePath()).WillByDefault(ReturnRef(base_path_));
    ON_CALL(config_, log()).WillByDefault(ReturnRef(log_config_));
    ON_CALL(config_, evalBatchSize()).WillByDefault(Return(10));
    ON_CALL(config_, minEvalPeriod())
        .WillByDefault(Return(std::chrono::minutes{20}));
    ON_CALL(config_, requestTimeout())
        .WillByDefault(Return(std::chrono::milliseconds{500}));
    ON_CALL(config_, scoringAlpha()).WillByDefault(Return(0.05));
    ON_CALL(config_, credibleThreshold()).WillByDefault(Return(0.8));
    ON_CALL(config_, rewardModelPath())
        .WillByDefault(ReturnRef(reward_model_path_));
    ON_CALL(config_, workerThreads()).WillByDefault(Return(1));
    ON_CALL(config_, saveInterval()).WillByDefault(Return(1000));

    EXPECT_CALL(*clock_, now())
        .WillRepeatedly(
            Return(primitives::TimePoint{std::chrono::hours{1000}}));
    EXPECT_CALL(*draw_, draw(_)).WillRepeatedly(Return(0.0));

    // uid 0 is a validator and is never audited, uid 1 is a miner
    participants_ = {
        Participant{.uid = 0,
                    .hotkey = "validator",
                    .stake = 1000.0,
                    .validator_trust = 1.0,
                    .validator_permit = true},
        Participant{.uid = 1, .hotkey = "miner"},
    };
    EXPECT_CALL(*table_, refresh()).Times(::testing::AnyNumber());
    EXPECT_CALL(*table_, participants()).WillRepeatedly([this] {
      return participants_;
    });

    // Miners never answer with an index, so every audit ends without data
    EXPECT_CALL(*client_, requestIndex(_, _, _))
        .WillRepeatedly([](const Participant &,
                           std::chrono::milliseconds,
                           MinerClient::IndexHandler handler) {
          handler(MinerClientError::UNREACHABLE);
        });
  }

  void TearDown() override {
    std::filesystem::remove_all(base_path_);
  }

  std::shared_ptr<FileStateStore> fileStore() {
    auto store = FileStateStore::create(base_path_);
    EXPECT_TRUE(store.has_value());
    return store.value();
  }

  std::unique_ptr<ValidatorService> makeService(
      std::shared_ptr<storage::StateStore> store) {
    return std::make_unique<ValidatorService>(config_,
                                              client_,
                                              table_,
                                              verifiers_,
                                              std::move(store),
                                              draw_,
                                              clock_);
  }

  static bool waitForStep(const ValidatorService &service, uint64_t step) {
    for (int i = 0; i < 500; ++i) {
      if (service.step() >= step) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    return false;
  }

  std::filesystem::path base_path_;
  std::vector<std::string> log_config_;
  std::optional<std::filesystem::path> reward_model_path_;
  std::vector<Participant> participants_;

  NiceMock<AppConfigurationMock> config_;
  std::shared_ptr<MinerClientMock> client_ =
      std::make_shared<MinerClientMock>();
  std::shared_ptr<ParticipantTableMock> table_ =
      std::make_shared<ParticipantTableMock>();
  std::shared_ptr<verification::VerifierProvider> verifiers_ =
      std::make_shared<verification::VerifierProvider>();
  std::shared_ptr<validator::UniformDrawMock> draw_ =
      std::make_shared<validator::UniformDrawMock>();
  std::shared_ptr<clock::SystemClockMock> clock_ =
      std::make_shared<clock::SystemClockMock>();
};

TEST_F(ValidatorServiceTest, NothingAvailableBeforeStart) {
  auto service = makeService(fileStore());
  EXPECT_EC(service->scores(), ValidatorServiceError::STATE_NOT_LOADED);
  EXPECT_EC(service->saveState(), ValidatorServiceError::STATE_NOT_LOADED);
  EXPECT_OUTCOME_TRUE_1(service->stop());
}

/**
 * @given an empty state directory
 * @when the service is started, runs a batch and is stopped
 * @then progress, hotkeys and trust state of every participant are saved
 */
TEST_F(ValidatorServiceTest, FreshStartSavesStateOnStop) {
  auto store = fileStore();
  auto service = makeService(store);
  EXPECT_OUTCOME_TRUE_1(service->start());

  EXPECT_OUTCOME_TRUE(scores, service->scores());
  EXPECT_EQ(scores.size(), 2);

  ASSERT_TRUE(waitForStep(*service, 1));
  EXPECT_OUTCOME_TRUE_1(service->stop());

  EXPECT_OUTCOME_TRUE(progress_bytes, store->load(storage::kValidatorStateKey));
  EXPECT_OUTCOME_TRUE(progress,
                      application::decodeValidatorState(progress_bytes));
  EXPECT_GE(progress.step, 1);
  EXPECT_EQ(progress.hotkeys,
            (std::vector<primitives::Hotkey>{"validator", "miner"}));

  EXPECT_OUTCOME_TRUE(trust_bytes, store->load(storage::kTrustStateKey));
  EXPECT_OUTCOME_TRUE(trust, validator::decodeTrustState(trust_bytes));
  EXPECT_EQ(trust.scores.size(), 2);
  EXPECT_OUTCOME_TRUE_1(store->load(storage::kMinerIndexKey));
}

/**
 * @given saved state from a previous run
 * @when the service is started again
 * @then the step counter continues and scores of participants that were
 * not audited are kept
 */
TEST_F(ValidatorServiceTest, RestartContinuesFromSavedState) {
  auto store = fileStore();
  EXPECT_OUTCOME_TRUE(trust,
                      validator::encodeTrustState(MinerTrustState{
                          .scores = {0.5, 0.3},
                          .credibility = {0.9, 0.4},
                      }));
  EXPECT_OUTCOME_TRUE_1(store->save(storage::kTrustStateKey, trust));
  EXPECT_OUTCOME_TRUE(progress,
                      application::encodeValidatorState(ValidatorState{
                          .step = 7,
                          .hotkeys = {"validator", "miner"},
                      }));
  EXPECT_OUTCOME_TRUE_1(store->save(storage::kValidatorStateKey, progress));

  auto service = makeService(store);
  EXPECT_OUTCOME_TRUE_1(service->start());
  EXPECT_GE(service->step(), 7);
  ASSERT_TRUE(waitForStep(*service, 8));
  EXPECT_OUTCOME_TRUE_1(service->stop());

  EXPECT_OUTCOME_TRUE(scores, service->scores());
  ASSERT_EQ(scores.size(), 2);
  EXPECT_DOUBLE_EQ(scores[0], 0.5);
  // the miner answered with nothing and lost its score
  EXPECT_DOUBLE_EQ(scores[1], 0.0);

  EXPECT_OUTCOME_TRUE(saved_bytes, store->load(storage::kTrustStateKey));
  EXPECT_OUTCOME_TRUE(saved, validator::decodeTrustState(saved_bytes));
  EXPECT_DOUBLE_EQ(saved.credibility[0], 0.9);
}

TEST_F(ValidatorServiceTest, CorruptTrustStateFailsStart) {
  auto store = fileStore();
  EXPECT_OUTCOME_TRUE_1(
      store->save(storage::kTrustStateKey, qtils::Bytes{1, 2, 3}));

  auto service = makeService(store);
  EXPECT_OUTCOME_FALSE_1(service->start());
  EXPECT_EC(service->scores(), ValidatorServiceError::STATE_NOT_LOADED);
}

TEST_F(ValidatorServiceTest, StoreFailureFailsStart) {
  auto store = std::make_shared<storage::StateStoreMock>();
  EXPECT_CALL(*store, load(_))
      .WillRepeatedly(Return(outcome::failure(
          std::make_error_code(std::errc::io_error))));
  EXPECT_CALL(*store, save(_, _)).Times(0);

  auto service = makeService(store);
  EXPECT_OUTCOME_FALSE_1(service->start());
}

TEST_F(ValidatorServiceTest, NoMinersFailsStart) {
  participants_.resize(1);
  auto service = makeService(fileStore());
  EXPECT_EC(service->start(), ValidatorServiceError::NO_MINERS);
}

TEST_F(ValidatorServiceTest, MissingRewardModelFailsStart) {
  reward_model_path_ = base_path_ / "no_such_rewards.json";
  auto service = makeService(fileStore());
  EXPECT_EC(service->start(), rewards::RewardModelError::MALFORMED_FILE);
}
