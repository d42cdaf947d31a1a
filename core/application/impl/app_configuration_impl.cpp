/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>

#include <boost/program_options.hpp>
#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>

#include "validator/miner_scorer.hpp"

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

  const std::string def_base_path = "./vigil-data";
}  // namespace

namespace vigil::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_{std::move(logger)},
        base_path_{def_base_path},
        eval_batch_size_{kDefaultEvalBatchSize},
        min_eval_period_sec_{kDefaultMinEvalPeriodSec},
        request_timeout_sec_{kDefaultRequestTimeoutSec},
        scoring_alpha_{validator::MinerScorer::kDefaultAlpha},
        credible_threshold_{validator::MinerScorer::kDefaultCredibleThreshold},
        worker_threads_{kDefaultWorkerThreads},
        save_interval_{kDefaultSaveInterval} {
    handlers_.emplace_back(SegmentHandler{
        "general",
        [this](const rapidjson::Value &val) { parse_general_segment(val); }});
    handlers_.emplace_back(SegmentHandler{
        "evaluation", [this](const rapidjson::Value &val) {
          parse_evaluation_segment(val);
        }});
    handlers_.emplace_back(SegmentHandler{
        "scoring",
        [this](const rapidjson::Value &val) { parse_scoring_segment(val); }});
  }

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m) {
      return false;
    }
    if (m->value.IsString()) {
      target.emplace_back(m->value.GetString(), m->value.GetStringLength());
    } else if (m->value.IsArray()) {
      for (auto &v : m->value.GetArray()) {
        if (v.IsString()) {
          target.emplace_back(v.GetString(), v.GetStringLength());
        }
      }
    }
    return not target.empty();
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_double(const rapidjson::Value &val,
                                         const char *name,
                                         double &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsNumber()) {
      target = m->value.GetDouble();
      return true;
    }
    return false;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    std::string base_path_str;
    if (load_str(val, "base-path", base_path_str)) {
      base_path_ = base_path_str;
    }
    load_ms(val, "log", logger_tuning_config_);
    uint32_t threads = 0;
    if (load_u32(val, "worker-threads", threads)) {
      worker_threads_ = threads;
    }
    load_u32(val, "save-interval", save_interval_);
  }

  void AppConfigurationImpl::parse_evaluation_segment(
      const rapidjson::Value &val) {
    uint32_t batch_size = 0;
    if (load_u32(val, "eval-batch-size", batch_size)) {
      eval_batch_size_ = batch_size;
    }
    load_u32(val, "min-eval-period", min_eval_period_sec_);
    load_u32(val, "request-timeout", request_timeout_sec_);
  }

  void AppConfigurationImpl::parse_scoring_segment(
      const rapidjson::Value &val) {
    load_double(val, "alpha", scoring_alpha_);
    load_double(val, "credible-threshold", credible_threshold_);
    std::string reward_model_str;
    if (load_str(val, "reward-model", reward_model_str)) {
      reward_model_path_ = reward_model_str;
    }
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with --config option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} is not an object", filepath);
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it and it->value.IsObject()) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::validate_config() {
    if (eval_batch_size_ == 0) {
      SL_ERROR(logger_, "Evaluation batch size must be positive");
      return false;
    }
    if (request_timeout_sec_ == 0) {
      SL_ERROR(logger_, "Request timeout must be positive");
      return false;
    }
    if (not(scoring_alpha_ > 0.0 and scoring_alpha_ <= 1.0)) {
      SL_ERROR(logger_,
               "Scoring alpha {} is out of range (0, 1]",
               scoring_alpha_);
      return false;
    }
    if (not(credible_threshold_ >= 0.0 and credible_threshold_ <= 1.0)) {
      SL_ERROR(logger_,
               "Credible threshold {} is out of range [0, 1]",
               credible_threshold_);
      return false;
    }
    if (worker_threads_ == 0) {
      SL_ERROR(logger_, "At least one worker thread is required");
      return false;
    }
    if (save_interval_ == 0) {
      SL_ERROR(logger_, "Save interval must be positive");
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -levaluator=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all groups log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("config", po::value<std::string>(), "Filepath to load configuration from.")
        ("base-path", po::value<std::string>()->default_value(def_base_path), "Directory where validator state is stored")
        ("worker-threads", po::value<uint32_t>()->default_value(static_cast<uint32_t>(kDefaultWorkerThreads)), "Number of threads running evaluations")
        ("save-interval", po::value<uint32_t>()->default_value(kDefaultSaveInterval), "State is saved every that many loop steps")
        ;

    po::options_description evaluation_desc("Evaluation options");
    evaluation_desc.add_options()
        ("eval-batch-size", po::value<uint32_t>()->default_value(static_cast<uint32_t>(kDefaultEvalBatchSize)), "Miners evaluated concurrently in one batch")
        ("min-eval-period", po::value<uint32_t>()->default_value(kDefaultMinEvalPeriodSec), "Minimum seconds between two evaluations of a miner")
        ("request-timeout", po::value<uint32_t>()->default_value(kDefaultRequestTimeoutSec), "Seconds to wait for a miner response")
        ;

    po::options_description scoring_desc("Scoring options");
    scoring_desc.add_options()
        ("scoring-alpha", po::value<double>()->default_value(validator::MinerScorer::kDefaultAlpha), "Weight of a new evaluation in score averages")
        ("credible-threshold", po::value<double>()->default_value(validator::MinerScorer::kDefaultCredibleThreshold), "Credibility at which a miner's claims are trusted")
        ("reward-model", po::value<std::string>(), "JSON file with the reward distribution model")
        ;
    // clang-format on

    desc.add(evaluation_desc).add(scoring_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    if (auto path = find_argument<std::string>(vm, "config")) {
      if (not read_config_from_file(*path)) {
        return false;
      }
    }

    find_argument<std::string>(
        vm, "base-path", [&](const std::string &val) { base_path_ = val; });
    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_ = val;
        });
    find_argument<uint32_t>(
        vm, "worker-threads", [&](uint32_t val) { worker_threads_ = val; });
    find_argument<uint32_t>(
        vm, "save-interval", [&](uint32_t val) { save_interval_ = val; });
    find_argument<uint32_t>(
        vm, "eval-batch-size", [&](uint32_t val) { eval_batch_size_ = val; });
    find_argument<uint32_t>(vm, "min-eval-period", [&](uint32_t val) {
      min_eval_period_sec_ = val;
    });
    find_argument<uint32_t>(vm, "request-timeout", [&](uint32_t val) {
      request_timeout_sec_ = val;
    });
    find_argument<double>(
        vm, "scoring-alpha", [&](double val) { scoring_alpha_ = val; });
    find_argument<double>(vm, "credible-threshold", [&](double val) {
      credible_threshold_ = val;
    });
    find_argument<std::string>(vm, "reward-model", [&](const std::string &val) {
      reward_model_path_ = val;
    });

    if (not validate_config()) {
      return false;
    }

    SL_DEBUG(logger_,
             "Configured: base path {}, batch {}, min period {}s, timeout {}s",
             base_path_.string(),
             eval_batch_size_,
             min_eval_period_sec_,
             request_timeout_sec_);
    return true;
  }

}  // namespace vigil::application
