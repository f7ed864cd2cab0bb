#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/spoilage_result.hpp"

struct redisContext;

namespace cold_chain::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"coldchain"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes each result as one TS.MADD batch. Series live under
// <key_prefix>:<product>:<metric> and are created the first time a product is
// seen on the current process.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();

  // One reconnect attempt on failure. Returns false once the server is known
  // to lack the RedisTimeSeries module.
  bool publish(const model::spoilage_result& result);

  static const std::vector<std::string>& metric_suffixes();

 private:
  using ContextHandle = std::unique_ptr<redisContext, void (*)(redisContext*)>;

  [[nodiscard]] bool connected() const noexcept;
  bool connect();
  bool handshake();
  const std::vector<std::string>* series_for(const std::string& product);
  bool send_batch(const std::vector<std::string>& keys, const model::spoilage_result& result);

  RedisTsOptions options_;
  ContextHandle context_;
  std::unordered_map<std::string, std::vector<std::string>> series_keys_;
  std::vector<std::string> args_;
  std::vector<const char*> argv_;
  std::vector<std::size_t> argv_len_;
  bool module_missing_{false};
};

}  // namespace cold_chain::sinks
