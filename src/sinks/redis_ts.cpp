#include "sinks/redis_ts.hpp"

#include <array>
#include <cmath>
#include <cstring>
#include <iostream>
#include <utility>

#include <hiredis/hiredis.h>

namespace cold_chain::sinks {
namespace {

constexpr std::size_t kMetricCount = 17;
constexpr std::size_t kBatchArgCount = 1 + (kMetricCount * 3);

struct MetricField {
  const char* suffix;
  double (*value)(const model::spoilage_result&);
};

double flag(const bool set) {
  return set ? 1.0 : 0.0;
}

const std::array<MetricField, kMetricCount>& metric_fields() {
  using model::spoilage_result;
  static const std::array<MetricField, kMetricCount> kFields{{
      {"score:instant_spoilage_pct", [](const spoilage_result& r) { return r.instant_spoilage_pct; }},
      {"score:cumulative_spoilage_pct", [](const spoilage_result& r) { return r.cumulative_spoilage_pct; }},
      {"score:quality", [](const spoilage_result& r) { return r.quality; }},
      {"score:decay_rate", [](const spoilage_result& r) { return r.decay_rate; }},
      {"risk:level", [](const spoilage_result& r) { return static_cast<double>(static_cast<std::uint8_t>(r.risk)); }},
      {"anomaly:zscore", [](const spoilage_result& r) { return flag(r.anomalies.zscore); }},
      {"anomaly:ewma", [](const spoilage_result& r) { return flag(r.anomalies.ewma); }},
      {"threshold:z", [](const spoilage_result& r) { return r.thresholds.z; }},
      {"threshold:ewma_l", [](const spoilage_result& r) { return r.thresholds.ewma_limit; }},
      {"threshold:warn", [](const spoilage_result& r) { return r.thresholds.warn; }},
      {"threshold:crit", [](const spoilage_result& r) { return r.thresholds.crit; }},
      {"factor:temp", [](const spoilage_result& r) { return r.contributions.temperature; }},
      {"factor:humidity", [](const spoilage_result& r) { return r.contributions.humidity; }},
      {"factor:door", [](const spoilage_result& r) { return r.contributions.door; }},
      {"factor:gas", [](const spoilage_result& r) { return r.contributions.gas; }},
      {"factor:interaction", [](const spoilage_result& r) { return r.contributions.interaction; }},
      {"factor:outside", [](const spoilage_result& r) { return r.contributions.outside; }},
  }};
  return kFields;
}

struct ReplyDeleter {
  void operator()(redisReply* reply) const { freeReplyObject(reply); }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

ReplyPtr take_reply(void* raw) {
  return ReplyPtr(static_cast<redisReply*>(raw));
}

bool failed(const ReplyPtr& reply) {
  return reply == nullptr || reply->type == REDIS_REPLY_ERROR;
}

bool error_mentions(const ReplyPtr& reply, const char* needle) {
  return reply != nullptr && reply->type == REDIS_REPLY_ERROR && reply->str != nullptr &&
         std::strstr(reply->str, needle) != nullptr;
}

std::string sample_value(const double value) {
  return std::to_string(std::isfinite(value) ? value : 0.0);
}

}  // namespace

const std::vector<std::string>& RedisTsSink::metric_suffixes() {
  static const std::vector<std::string> kSuffixes = [] {
    std::vector<std::string> suffixes;
    suffixes.reserve(kMetricCount);
    for (const auto& field : metric_fields()) {
      suffixes.emplace_back(field.suffix);
    }
    return suffixes;
  }();
  return kSuffixes;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)), context_(nullptr, &redisFree) {
  args_.reserve(kBatchArgCount);
  argv_.reserve(kBatchArgCount);
  argv_len_.reserve(kBatchArgCount);
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::connected() const noexcept {
  return context_ != nullptr && context_->err == REDIS_OK;
}

bool RedisTsSink::check_connectivity() {
  if (module_missing_) {
    return false;
  }
  return connected() || connect();
}

bool RedisTsSink::connect() {
  context_.reset();

  const timeval timeout{static_cast<time_t>(options_.connect_timeout_ms / 1000),
                        static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000)};
  ContextHandle fresh(options_.unix_socket.empty()
                          ? redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout)
                          : redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout),
                      &redisFree);
  if (fresh == nullptr) {
    std::cerr << "[redis] connect failed: out of memory\n";
    return false;
  }
  if (fresh->err != REDIS_OK) {
    std::cerr << "[redis] connect failed: " << fresh->errstr << '\n';
    return false;
  }

  context_ = std::move(fresh);
  if (!handshake()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::handshake() {
  if (!options_.password.empty()) {
    const ReplyPtr reply = take_reply(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
    if (failed(reply)) {
      std::cerr << "[redis] AUTH rejected\n";
      return false;
    }
  }

  if (options_.db != 0) {
    const ReplyPtr reply = take_reply(redisCommand(context_.get(), "SELECT %d", options_.db));
    if (failed(reply)) {
      std::cerr << "[redis] SELECT " << options_.db << " rejected\n";
      return false;
    }
  }
  return true;
}

const std::vector<std::string>* RedisTsSink::series_for(const std::string& product) {
  const auto cached = series_keys_.find(product);
  if (cached != series_keys_.end()) {
    return &cached->second;
  }

  std::vector<std::string> keys;
  keys.reserve(kMetricCount);
  for (const auto& field : metric_fields()) {
    keys.push_back(options_.key_prefix + ":" + product + ":" + field.suffix);
    const ReplyPtr reply =
        take_reply(redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST LABELS product %s",
                                keys.back().c_str(), product.c_str()));
    if (reply == nullptr) {
      return nullptr;
    }
    if (error_mentions(reply, "unknown command")) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      module_missing_ = true;
      return nullptr;
    }
    if (reply->type == REDIS_REPLY_ERROR && !error_mentions(reply, "already exists")) {
      std::cerr << "[redis] TS.CREATE " << keys.back() << " failed: " << (reply->str != nullptr ? reply->str : "unknown")
                << '\n';
      return nullptr;
    }
  }

  return &series_keys_.emplace(product, std::move(keys)).first->second;
}

bool RedisTsSink::send_batch(const std::vector<std::string>& keys, const model::spoilage_result& result) {
  const auto& fields = metric_fields();

  // Server-side timestamps; reading ts may be monotonic.
  args_.clear();
  args_.emplace_back("TS.MADD");
  for (std::size_t i = 0; i < fields.size(); ++i) {
    args_.push_back(keys[i]);
    args_.emplace_back("*");
    args_.push_back(sample_value(fields[i].value(result)));
  }

  argv_.clear();
  argv_len_.clear();
  for (const auto& arg : args_) {
    argv_.push_back(arg.c_str());
    argv_len_.push_back(arg.size());
  }

  const ReplyPtr reply =
      take_reply(redisCommandArgv(context_.get(), static_cast<int>(argv_.size()), argv_.data(), argv_len_.data()));
  return !failed(reply);
}

bool RedisTsSink::publish(const model::spoilage_result& result) {
  for (int attempt = 0; attempt < 2 && !module_missing_; ++attempt) {
    if (!connected() && !connect()) {
      return false;
    }

    const std::vector<std::string>* keys = series_for(result.product);
    if (keys != nullptr && send_batch(*keys, result)) {
      return true;
    }
    context_.reset();
  }
  return false;
}

}  // namespace cold_chain::sinks
