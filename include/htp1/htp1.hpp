#pragma once

#include <arpa/inet.h>
#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cctype>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <netdb.h>
#include <netinet/in.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/time.h>
#include <thread>
#include <tuple>
#include <unistd.h>
#include <unordered_map>
#include <utility>
#include <vector>

namespace htp1 {

using json = nlohmann::ordered_json;

/// Websocket endpoint serving the control protocol.
constexpr std::string_view kControllerPath = "/ws/controller";

/// Reserved subject fired when the connection is established or lost.
constexpr std::string_view kConnectionSubject = "#connection";

constexpr std::string_view kPowerPath = "/powerIsOn";
constexpr std::string_view kVolumePath = "/volume";
constexpr std::string_view kMutedPath = "/muted";
constexpr std::string_view kInputPath = "/input";
constexpr std::string_view kUpmixPath = "/upmix/select";

class htp1_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Name resolution or transport failure, or no initial state in time.
class connection_error : public htp1_error {
public:
  using htp1_error::htp1_error;
};

/// Nested transactions, writes outside a transaction.
class usage_error : public htp1_error {
public:
  using htp1_error::htp1_error;
};

/// A path, label or index the device state does not contain.
class lookup_error : public htp1_error {
public:
  using htp1_error::htp1_error;
};

/// The device sent something the client cannot apply.
class protocol_error : public htp1_error {
public:
  using htp1_error::htp1_error;
};

/// Client settings. Durations are in milliseconds.
struct client_options {
  std::string host;
  int mso_timeout_ms = 5000;
  int reconnect_initial_delay_ms = 5000;
  int reconnect_max_delay_ms = 300000;
  int connect_timeout_ms = 10000;
};

/// Parse --host, --mso-timeout, --reconnect-initial, --reconnect-max and
/// --connect-timeout from command-line args. Unknown flags are left alone.
inline client_options parse_flags(const std::vector<std::string> &args) {
  client_options opts;
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    const auto &flag = args[i];
    const auto &value = args[i + 1];
    if (flag == "--host")
      opts.host = value;
    else if (flag == "--mso-timeout")
      opts.mso_timeout_ms = std::stoi(value);
    else if (flag == "--reconnect-initial")
      opts.reconnect_initial_delay_ms = std::stoi(value);
    else if (flag == "--reconnect-max")
      opts.reconnect_max_delay_ms = std::stoi(value);
    else if (flag == "--connect-timeout")
      opts.connect_timeout_ms = std::stoi(value);
    else
      continue;
    ++i;
  }
  return opts;
}

/// Extract the scheme from a URI.
inline std::string scheme(std::string_view uri) {
  auto pos = uri.find("://");
  return pos != std::string_view::npos ? std::string(uri.substr(0, pos))
                                       : std::string(uri);
}

/// Parsed websocket URI.
struct parsed_uri {
  std::string raw;
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path;
};

inline std::tuple<std::string, int> split_host_port(const std::string &addr,
                                                     int default_port) {
  if (addr.empty())
    throw std::invalid_argument("missing host");

  auto pos = addr.rfind(':');
  if (pos == std::string::npos)
    return {addr, default_port};

  std::string host = addr.substr(0, pos);
  if (host.empty())
    throw std::invalid_argument("missing host: " + addr);
  std::string port_text = addr.substr(pos + 1);
  int port = port_text.empty() ? default_port : std::stoi(port_text);
  return {host, port};
}

inline parsed_uri parse_uri(const std::string &uri) {
  std::string s = scheme(uri);
  if (s == "wss")
    throw std::invalid_argument("wss:// is not spoken by the device: " + uri);
  if (s != "ws" || uri.rfind("ws://", 0) != 0)
    throw std::invalid_argument("unsupported websocket URI: " + uri);

  std::string trimmed = uri.substr(5);
  auto slash = trimmed.find('/');
  std::string addr =
      slash == std::string::npos ? trimmed : trimmed.substr(0, slash);
  std::string path =
      slash == std::string::npos ? "/" : trimmed.substr(slash);

  auto [host, port] = split_host_port(addr, 80);
  return {uri, s, host, port, path};
}

/// Control endpoint of the device at `host` (optionally `host:port`).
inline std::string controller_url(const std::string &host) {
  return "ws://" + host + std::string(kControllerPath);
}

// Websocket framing (RFC 6455), shared by the client transport and tests.

enum class opcode : uint8_t {
  continuation = 0x0,
  text = 0x1,
  binary = 0x2,
  close = 0x8,
  ping = 0x9,
  pong = 0xA,
};

struct frame {
  bool fin = true;
  opcode op = opcode::text;
  std::string payload;
};

/// Encode a single final frame. Client frames must be masked; pass nullptr
/// for an unmasked (server side) frame.
inline std::string encode_frame(opcode op, const std::string &payload,
                                const std::array<uint8_t, 4> *mask) {
  std::string out;
  out.reserve(payload.size() + 14);
  out.push_back(static_cast<char>(0x80 | (static_cast<uint8_t>(op) & 0x0F)));

  const uint8_t mask_bit = mask != nullptr ? 0x80 : 0x00;
  uint64_t len = payload.size();
  if (len < 126) {
    out.push_back(static_cast<char>(mask_bit | len));
  } else if (len <= 0xFFFF) {
    out.push_back(static_cast<char>(mask_bit | 126));
    out.push_back(static_cast<char>((len >> 8) & 0xFF));
    out.push_back(static_cast<char>(len & 0xFF));
  } else {
    out.push_back(static_cast<char>(mask_bit | 127));
    for (int i = 7; i >= 0; --i) {
      out.push_back(static_cast<char>((len >> (i * 8)) & 0xFF));
    }
  }

  if (mask == nullptr) {
    out.append(payload);
    return out;
  }

  for (auto b : *mask) {
    out.push_back(static_cast<char>(b));
  }
  for (size_t i = 0; i < payload.size(); ++i) {
    out.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^
                                    (*mask)[i % 4]));
  }
  return out;
}

inline bool write_all(int fd, const void *data, size_t size) {
  const auto *ptr = static_cast<const uint8_t *>(data);
  size_t sent = 0;
  while (sent < size) {
    ssize_t n = ::send(fd, ptr + sent, size - sent, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

inline bool read_exact(int fd, void *data, size_t size) {
  auto *ptr = static_cast<uint8_t *>(data);
  size_t got = 0;
  while (got < size) {
    ssize_t n = ::recv(fd, ptr + got, size - got, 0);
    if (n <= 0) {
      return false;
    }
    got += static_cast<size_t>(n);
  }
  return true;
}

/// Largest frame payload accepted from a peer.
constexpr uint64_t kMaxFramePayload = 16 * 1024 * 1024;

/// Read one frame, unmasking it if needed. False on EOF, error or a payload
/// larger than kMaxFramePayload.
inline bool read_frame(int fd, frame &out) {
  uint8_t header[2];
  if (!read_exact(fd, header, 2)) {
    return false;
  }

  out.fin = (header[0] & 0x80) != 0;
  out.op = static_cast<opcode>(header[0] & 0x0F);
  bool masked = (header[1] & 0x80) != 0;
  uint64_t len = static_cast<uint64_t>(header[1] & 0x7F);

  if (len == 126) {
    uint8_t ext[2];
    if (!read_exact(fd, ext, 2)) {
      return false;
    }
    len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
  } else if (len == 127) {
    uint8_t ext[8];
    if (!read_exact(fd, ext, 8)) {
      return false;
    }
    len = 0;
    for (int i = 0; i < 8; ++i) {
      len = (len << 8) | ext[i];
    }
  }

  if (len > kMaxFramePayload) {
    return false;
  }

  std::array<uint8_t, 4> mask{};
  if (masked && !read_exact(fd, mask.data(), mask.size())) {
    return false;
  }

  out.payload.assign(len, '\0');
  if (len > 0 && !read_exact(fd, out.payload.data(), len)) {
    return false;
  }
  if (masked) {
    for (size_t i = 0; i < out.payload.size(); ++i) {
      out.payload[i] = static_cast<char>(out.payload[i] ^ mask[i % 4]);
    }
  }
  return true;
}

/// A received websocket message.
struct message {
  enum class kind { text, binary, close };

  kind type = kind::close;
  std::string data;
};

/// An open websocket. `receive` blocks; `close` may be called from any
/// thread and makes a pending `receive` return a close message.
class websocket {
public:
  virtual ~websocket() = default;

  virtual void send_text(const std::string &text) = 0;
  virtual message receive() = 0;
  virtual void close() = 0;
};

class transport {
public:
  virtual ~transport() = default;

  /// Open a websocket to `url`. Throws connection_error.
  virtual std::shared_ptr<websocket> open(const std::string &url) = 0;
};

class posix_websocket : public websocket {
public:
  explicit posix_websocket(int fd) : fd_(fd) {}

  ~posix_websocket() override {
    close();
    ::close(fd_);
  }

  posix_websocket(const posix_websocket &) = delete;
  posix_websocket &operator=(const posix_websocket &) = delete;

  void send_text(const std::string &text) override {
    if (!send_frame(opcode::text, text)) {
      throw connection_error("websocket send failed");
    }
  }

  message receive() override {
    std::string assembled;
    opcode assembling = opcode::text;
    frame f;

    while (read_frame(fd_, f)) {
      if (f.op == opcode::close) {
        break;
      }
      if (f.op == opcode::ping) {
        if (!send_frame(opcode::pong, f.payload)) {
          break;
        }
        continue;
      }
      if (f.op == opcode::text || f.op == opcode::binary) {
        assembling = f.op;
        assembled = std::move(f.payload);
      } else if (f.op == opcode::continuation) {
        assembled.append(f.payload);
      } else {
        continue; // pong, reserved
      }

      if (f.fin) {
        return {assembling == opcode::text ? message::kind::text
                                           : message::kind::binary,
                std::move(assembled)};
      }
    }
    return {message::kind::close, {}};
  }

  void close() override {
    if (!closed_.exchange(true)) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }

private:
  bool send_frame(opcode op, const std::string &payload) {
    if (closed_.load()) {
      return false;
    }
    std::lock_guard<std::mutex> lock(send_mu_);
    std::array<uint8_t, 4> mask{};
    for (auto &b : mask) {
      b = static_cast<uint8_t>(random_device_());
    }
    auto data = encode_frame(op, payload, &mask);
    return write_all(fd_, data.data(), data.size());
  }

  int fd_;
  std::atomic<bool> closed_{false};
  std::mutex send_mu_;
  std::random_device random_device_;
};

/// Plaintext websocket client over POSIX sockets.
class posix_transport : public transport {
public:
  explicit posix_transport(int connect_timeout_ms = 10000)
      : connect_timeout_ms_(connect_timeout_ms) {}

  std::shared_ptr<websocket> open(const std::string &url) override {
    parsed_uri parsed;
    try {
      parsed = parse_uri(url);
    } catch (const std::logic_error &e) {
      // invalid_argument for the scheme, out_of_range for the port
      throw connection_error(std::string("bad url ") + url + ": " + e.what());
    }

    int fd = dial(parsed.host, parsed.port);
    try {
      handshake(fd, parsed);
    } catch (const connection_error &) {
      ::close(fd);
      throw;
    }
    return std::make_shared<posix_websocket>(fd);
  }

private:
  static void set_timeouts(int fd, int timeout_ms) {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  }

  int dial(const std::string &host, int port) const {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *found = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints,
                           &found);
    if (rc != 0) {
      throw connection_error("cannot resolve " + host + ": " +
                             ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(found,
                                                               ::freeaddrinfo);

    std::string last_error = "no usable address";
    for (auto *ai = found; ai != nullptr; ai = ai->ai_next) {
      int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
      if (fd < 0) {
        last_error = std::strerror(errno);
        continue;
      }
      // SO_SNDTIMEO bounds connect() on Linux.
      set_timeouts(fd, connect_timeout_ms_);
      if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        return fd;
      }
      last_error = std::strerror(errno);
      ::close(fd);
    }
    throw connection_error("cannot connect to " + host + ":" +
                           std::to_string(port) + ": " + last_error);
  }

  static void handshake(int fd, const parsed_uri &parsed) {
    std::ostringstream req;
    req << "GET " << parsed.path << " HTTP/1.1\r\n";
    req << "Host: " << parsed.host;
    if (parsed.port != 80)
      req << ":" << parsed.port;
    req << "\r\n";
    req << "Upgrade: websocket\r\n";
    req << "Connection: Upgrade\r\n";
    req << "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n";
    req << "Sec-WebSocket-Version: 13\r\n\r\n";

    auto req_str = req.str();
    if (!write_all(fd, req_str.data(), req_str.size())) {
      throw connection_error("websocket handshake send failed");
    }

    std::string headers;
    headers.reserve(1024);
    char ch = 0;
    while (headers.find("\r\n\r\n") == std::string::npos) {
      ssize_t n = ::recv(fd, &ch, 1, 0);
      if (n <= 0) {
        throw connection_error("websocket handshake interrupted");
      }
      headers.push_back(ch);
      if (headers.size() > 16384) {
        throw connection_error("websocket handshake too large");
      }
    }

    auto status_end = headers.find("\r\n");
    if (headers.substr(0, status_end).find(" 101") == std::string::npos) {
      throw connection_error("websocket upgrade refused: " +
                             headers.substr(0, status_end));
    }

    // Reads now block until data or close().
    set_timeouts(fd, 0);
  }

  int connect_timeout_ms_;
};

// Patch engine over the mirrored document.

/// Split "/inputs/2/label" into {"inputs", "2", "label"}.
inline std::vector<std::string> split_path(const std::string &path) {
  if (path.empty() || path.front() != '/') {
    throw lookup_error("path must be absolute: " + path);
  }
  std::vector<std::string> segments;
  size_t start = 1;
  while (true) {
    auto slash = path.find('/', start);
    segments.push_back(path.substr(start, slash - start));
    if (slash == std::string::npos)
      break;
    start = slash + 1;
  }
  return segments;
}

inline size_t parse_index(const std::string &segment, size_t size) {
  if (segment.empty() ||
      !std::all_of(segment.begin(), segment.end(),
                   [](unsigned char c) { return std::isdigit(c) != 0; })) {
    throw lookup_error("invalid sequence index: " + segment);
  }
  size_t index = std::stoul(segment);
  if (index >= size) {
    throw lookup_error("sequence index out of range: " + segment);
  }
  return index;
}

inline json &child(json &node, const std::string &segment) {
  if (node.is_array())
    return node[parse_index(segment, node.size())];
  if (node.is_object()) {
    auto it = node.find(segment);
    if (it == node.end())
      throw lookup_error("no member '" + segment + "'");
    return *it;
  }
  throw lookup_error("cannot descend into scalar at '" + segment + "'");
}

inline const json &child(const json &node, const std::string &segment) {
  return child(const_cast<json &>(node), segment);
}

/// Value at an absolute path. Throws lookup_error.
inline const json &lookup(const json &doc, const std::string &path) {
  const json *node = &doc;
  for (const auto &segment : split_path(path)) {
    node = &child(*node, segment);
  }
  return *node;
}

/// One applied operation, for notification.
struct patch_result {
  std::string path;
  json before;
  json after;
};

inline bool supported_op(const std::string &op) {
  return op == "add" || op == "replace";
}

/// Apply a single add/replace operation in place. Both ops set the value at
/// the location; an array index must already exist.
inline patch_result apply_operation(json &doc, const json &operation) {
  const auto op = operation.at("op").get<std::string>();
  if (!supported_op(op)) {
    throw protocol_error("unimplemented patch operation: " + op);
  }

  auto path = operation.at("path").get<std::string>();
  auto segments = split_path(path);
  const std::string last = segments.back();
  segments.pop_back();

  json *parent = &doc;
  for (const auto &segment : segments) {
    parent = &child(*parent, segment);
  }

  patch_result result{path, nullptr, operation.at("value")};
  if (parent->is_array()) {
    auto &slot = (*parent)[parse_index(last, parent->size())];
    result.before = slot;
    slot = result.after;
  } else if (parent->is_object()) {
    auto it = parent->find(last);
    if (it != parent->end())
      result.before = *it;
    (*parent)[last] = result.after;
  } else {
    throw lookup_error("cannot assign into scalar at " + path);
  }
  return result;
}

/// Apply an msoupdate payload: one operation object or an array of them.
/// The batch is applied to a copy that replaces `doc` only once every op
/// succeeded, so a failing op leaves the document untouched.
inline std::vector<patch_result> apply_patch(json &doc, const json &payload) {
  std::vector<const json *> operations;
  if (payload.is_array()) {
    for (const auto &operation : payload)
      operations.push_back(&operation);
  } else {
    operations.push_back(&payload);
  }

  for (const auto *operation : operations) {
    if (!operation->is_object()) {
      throw protocol_error("patch operation is not an object: " +
                           operation->dump());
    }
    const auto op = operation->at("op").get<std::string>();
    if (!supported_op(op)) {
      throw protocol_error("unimplemented patch operation: " + op);
    }
  }

  json staged = doc;
  std::vector<patch_result> results;
  results.reserve(operations.size());
  for (const auto *operation : operations) {
    results.push_back(apply_operation(staged, *operation));
  }
  doc = std::move(staged);
  return results;
}

/// Observers keyed by subject, notified in registration order.
class subscription_registry {
public:
  using callback = std::function<void(const json &)>;

  void subscribe(std::string_view subject, callback cb) {
    if (!cb) {
      throw std::invalid_argument("callback is required");
    }
    std::lock_guard<std::mutex> lock(mu_);
    subscribers_[std::string(subject)].push_back(std::move(cb));
  }

  /// Invoke every callback for `subject`, sequentially. Callbacks run
  /// without the registry lock held.
  void notify(std::string_view subject, const json &value = nullptr) const {
    std::vector<callback> snapshot;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = subscribers_.find(std::string(subject));
      if (it == subscribers_.end()) {
        return;
      }
      snapshot = it->second;
    }
    spdlog::debug("[htp1] notify: subject={}, subscribers={}", subject,
                  snapshot.size());
    for (const auto &cb : snapshot) {
      cb(value);
    }
  }

  size_t count(std::string_view subject) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = subscribers_.find(std::string(subject));
    return it == subscribers_.end() ? 0 : it->second.size();
  }

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::vector<callback>> subscribers_;
};

/// Doubling reconnect delay between an initial value and a ceiling.
class reconnect_policy {
public:
  reconnect_policy(int initial_delay_ms, int max_delay_ms)
      : initial_delay_ms_(initial_delay_ms),
        max_delay_ms_(std::max(initial_delay_ms, max_delay_ms)),
        current_delay_ms_(initial_delay_ms) {}

  int current_delay_ms() const { return current_delay_ms_; }

  /// Delay to wait after a failed attempt; the following one doubles.
  int next_delay_ms() {
    int delay = current_delay_ms_;
    current_delay_ms_ = static_cast<int>(std::min<long long>(
        2LL * current_delay_ms_, max_delay_ms_));
    return delay;
  }

  void reset() { current_delay_ms_ = initial_delay_ms_; }

private:
  int initial_delay_ms_;
  int max_delay_ms_;
  int current_delay_ms_;
};

/// Cooperative cancellation for the reconnect supervisor.
class cancellation {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cancelled_;
  }

  /// Sleep unless cancelled first. Returns false when cancelled.
  bool sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mu_);
    return !cv_.wait_for(lock, duration, [this]() { return cancelled_; });
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

class client;

/// Handle on the client's single open batch of pending writes. Leaving
/// scope without commit() discards the writes.
class transaction {
public:
  transaction(const transaction &) = delete;
  transaction &operator=(const transaction &) = delete;
  transaction &operator=(transaction &&) = delete;

  transaction(transaction &&other) noexcept
      : owner_(std::exchange(other.owner_, nullptr)), id_(other.id_) {}

  ~transaction() { discard(); }

  /// Send all pending writes as one changemso. False when there was
  /// nothing to send. The transaction stays open.
  bool commit();

  void discard() noexcept;

  bool active() const;

private:
  friend class client;

  transaction(client *owner, uint64_t id) : owner_(owner), id_(id) {}

  client *owner_;
  uint64_t id_;
};

/// Persistent client for one HTP-1. Mirrors the device's mso document and
/// writes to it through transactions.
class client {
public:
  using callback = subscription_registry::callback;

  explicit client(client_options options,
                  std::shared_ptr<transport> io = nullptr)
      : options_(std::move(options)), transport_(std::move(io)),
        policy_(options_.reconnect_initial_delay_ms,
                options_.reconnect_max_delay_ms) {
    if (options_.host.empty()) {
      throw std::invalid_argument("host is required");
    }
    if (!transport_) {
      transport_ =
          std::make_shared<posix_transport>(options_.connect_timeout_ms);
    }
    handlers_["mso"] = [this](const json &payload) { handle_mso(payload); };
    handlers_["msoupdate"] = [this](const json &payload) {
      handle_msoupdate(payload);
    };
  }

  ~client() { stop(); }

  client(const client &) = delete;
  client &operator=(const client &) = delete;

  const client_options &options() const { return options_; }

  /// Open the control websocket and wait for the initial state.
  /// Throws connection_error.
  void connect() { connect_once(nullptr); }

  /// Keep trying to connect in the background, backing off between
  /// attempts. Returns immediately.
  void try_connect() {
    std::thread finished;
    {
      std::lock_guard<std::mutex> lock(task_mu_);
      if (stopping_) {
        return;
      }
      if (supervising_) {
        spdlog::debug("[htp1] try_connect: already trying");
        return;
      }
      finished = std::move(supervisor_);
      auto token = std::make_shared<cancellation>();
      supervisor_token_ = token;
      supervising_ = true;
      supervisor_ = std::thread([this, token]() { reconnect_loop(token); });
    }
    join_or_detach(finished);
  }

  /// Stop reconnecting, close the connection and drop all state.
  void stop() {
    spdlog::debug("[htp1] stop:");
    {
      std::lock_guard<std::mutex> lock(task_mu_);
      stopping_ = true;
    }
    stop_connect();
    disconnect();
    reset();
    {
      std::lock_guard<std::mutex> lock(task_mu_);
      stopping_ = false;
    }
  }

  /// True once the initial state arrived on the live connection.
  bool connected() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return ready_;
  }

  /// True while a reconnect supervisor is running.
  bool reconnecting() const {
    std::lock_guard<std::mutex> lock(task_mu_);
    return supervising_;
  }

  int reconnect_delay_ms() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return policy_.current_delay_ms();
  }

  /// Subscribe to a state path ("/volume") or to kConnectionSubject.
  void subscribe(std::string_view subject, callback cb) {
    spdlog::debug("[htp1] subscribe: subject={}", subject);
    subscriptions_.subscribe(subject, std::move(cb));
  }

  /// Open the single transaction. Throws usage_error if one is open.
  transaction begin_transaction() {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (tx_) {
      throw usage_error("transaction already in progress");
    }
    tx_ = pending_writes{++next_tx_id_, {}};
    return transaction(this, tx_->id);
  }

  /// Copy of the mirrored document, if any.
  std::optional<json> state() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return mso_;
  }

  std::string serial_number() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return lookup(require_state(), "/versions/SerialNumber")
        .get<std::string>();
  }

  /// Calibrated maximum volume.
  double cal_vph() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return lookup(require_state(), "/cal/vph").get<double>();
  }

  /// Calibrated minimum volume.
  double cal_vpl() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return lookup(require_state(), "/cal/vpl").get<double>();
  }

  /// Power state, empty when not known.
  std::optional<bool> power() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (auto pending = pending_value(std::string(kPowerPath))) {
      return pending->get<bool>();
    }
    if (!mso_) {
      return std::nullopt;
    }
    auto it = mso_->find("powerIsOn");
    if (it == mso_->end() || !it->is_boolean()) {
      return std::nullopt;
    }
    return it->get<bool>();
  }

  void set_power(bool on) { write(kPowerPath, on); }

  double volume() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return field(kVolumePath).get<double>();
  }

  void set_volume(double db) {
    // Whole decibels go out as integers, like the device reports them.
    double whole = std::round(db);
    if (whole == db && std::abs(whole) < 1e9) {
      write(kVolumePath, static_cast<long long>(whole));
    } else {
      write(kVolumePath, db);
    }
  }

  /// Volume mapped onto 0..1 between the calibration bounds.
  double volume_level() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    const auto &doc = require_state();
    double vph = lookup(doc, "/cal/vph").get<double>();
    double vpl = lookup(doc, "/cal/vpl").get<double>();
    double vol = field(kVolumePath).get<double>();
    if (vph == vpl) {
      return 0.0;
    }
    return (vol - vpl) / (vph - vpl);
  }

  void set_volume_level(double level) {
    double vph = 0.0;
    double vpl = 0.0;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      require_transaction();
      const auto &doc = require_state();
      vph = lookup(doc, "/cal/vph").get<double>();
      vpl = lookup(doc, "/cal/vpl").get<double>();
    }
    set_volume(level * (vph - vpl) + vpl);
  }

  bool muted() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return field(kMutedPath).get<bool>();
  }

  void set_muted(bool muted) { write(kMutedPath, muted); }

  /// Label of the selected input.
  std::string input() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    auto id = field(kInputPath).get<std::string>();
    return lookup(require_state(), "/inputs/" + id + "/label")
        .get<std::string>();
  }

  /// Select an input by its label. Throws lookup_error for unknown labels.
  void set_input(const std::string &label) {
    std::lock_guard<std::mutex> lock(state_mu_);
    require_transaction();
    const auto &inputs = lookup(require_state(), "/inputs");
    if (inputs.is_object()) {
      for (const auto &[id, info] : inputs.items()) {
        auto it = info.find("label");
        if (it != info.end() && it->is_string() &&
            it->get<std::string>() == label) {
          tx_->writes[std::string(kInputPath)] = id;
          return;
        }
      }
    }
    throw lookup_error("input '" + label + "' not found");
  }

  /// Labels of the inputs marked visible, in device order.
  std::vector<std::string> inputs() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    std::vector<std::string> labels;
    if (!mso_) {
      return labels;
    }
    auto inputs = mso_->find("inputs");
    if (inputs == mso_->end() || !inputs->is_object()) {
      return labels;
    }
    for (const auto &info : *inputs) {
      if (info.is_object() && info.value("visible", false)) {
        labels.push_back(info.value("label", std::string()));
      }
    }
    return labels;
  }

  std::string upmix() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return field(kUpmixPath).get<std::string>();
  }

  /// Select a sound mode by name. Throws lookup_error for unknown names.
  void set_upmix(const std::string &name) {
    std::lock_guard<std::mutex> lock(state_mu_);
    require_transaction();
    const auto &upmix = lookup(require_state(), "/upmix");
    if (name == "select" || !upmix.is_object() || !upmix.contains(name)) {
      throw lookup_error("upmix '" + name + "' not found");
    }
    tx_->writes[std::string(kUpmixPath)] = name;
  }

  /// Sound modes shown on the device's home screen.
  std::vector<std::string> upmixes() const {
    std::lock_guard<std::mutex> lock(state_mu_);
    std::vector<std::string> names;
    if (!mso_) {
      return names;
    }
    auto upmix = mso_->find("upmix");
    if (upmix == mso_->end() || !upmix->is_object()) {
      return names;
    }
    for (const auto &[name, info] : upmix->items()) {
      if (name != "select" && info.is_object() &&
          info.value("homevis", false)) {
        names.push_back(name);
      }
    }
    return names;
  }

private:
  friend class transaction;

  struct pending_writes {
    uint64_t id = 0;
    std::map<std::string, json> writes;
  };

  static void join_or_detach(std::thread &t) {
    if (!t.joinable()) {
      return;
    }
    if (t.get_id() == std::this_thread::get_id()) {
      t.detach();
    } else {
      t.join();
    }
  }

  // The helpers below expect state_mu_ to be held.

  const json &require_state() const {
    if (!mso_) {
      throw htp1_error("no device state: not connected");
    }
    return *mso_;
  }

  void require_transaction() const {
    if (!tx_) {
      throw usage_error("no transaction in progress");
    }
  }

  std::optional<json> pending_value(const std::string &path) const {
    if (tx_) {
      auto it = tx_->writes.find(path);
      if (it != tx_->writes.end()) {
        return it->second;
      }
    }
    return std::nullopt;
  }

  json field(std::string_view path) const {
    std::string key(path);
    if (auto pending = pending_value(key)) {
      return *pending;
    }
    return lookup(require_state(), key);
  }

  void write(std::string_view path, json value) {
    std::lock_guard<std::mutex> lock(state_mu_);
    require_transaction();
    tx_->writes[std::string(path)] = std::move(value);
  }

  bool transaction_open(uint64_t id) const {
    std::lock_guard<std::mutex> lock(state_mu_);
    return tx_ && tx_->id == id;
  }

  bool commit_pending(uint64_t id) {
    std::shared_ptr<websocket> ws;
    std::map<std::string, json> sent;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (!tx_ || tx_->id != id || tx_->writes.empty()) {
        spdlog::debug("[htp1] commit: nothing to do");
        return false;
      }
      if (!socket_) {
        throw connection_error("not connected");
      }
      ws = socket_;
      sent = tx_->writes;
    }

    json ops = json::array();
    for (const auto &[path, value] : sent) {
      ops.push_back({{"op", "replace"}, {"path", path}, {"value", value}});
    }
    auto payload = ops.dump();
    spdlog::debug("[htp1] commit: {}", payload);
    // The socket write may block on a slow peer: keep the state lock free.
    ws->send_text("changemso " + payload);

    std::lock_guard<std::mutex> lock(state_mu_);
    if (tx_ && tx_->id == id) {
      // Writes made while sending stay pending for the next commit.
      for (const auto &[path, value] : sent) {
        auto it = tx_->writes.find(path);
        if (it != tx_->writes.end() && it->second == value) {
          tx_->writes.erase(it);
        }
      }
    }
    return true;
  }

  void discard_pending(uint64_t id) noexcept {
    std::lock_guard<std::mutex> lock(state_mu_);
    if (tx_ && tx_->id == id) {
      tx_.reset();
    }
  }

  void reset() {
    std::lock_guard<std::mutex> lock(state_mu_);
    mso_.reset();
    tx_.reset();
    ready_ = false;
    remote_closed_ = false;
  }

  void connect_once(const cancellation *token) {
    disconnect();
    reset();

    const auto url = controller_url(options_.host);
    spdlog::debug("[htp1] connect: url={}", url);

    try {
      auto ws = transport_->open(url);
      {
        std::lock_guard<std::mutex> lock(state_mu_);
        socket_ = ws;
        receive_thread_ = std::thread([this, ws]() { receive_loop(ws); });
      }

      spdlog::debug("[htp1] connect: requesting mso");
      ws->send_text("getmso");

      std::unique_lock<std::mutex> lock(state_mu_);
      ready_cv_.wait_for(
          lock, std::chrono::milliseconds(options_.mso_timeout_ms), [&]() {
            return ready_ || remote_closed_ ||
                   (token != nullptr && token->cancelled());
          });
      if (!ready_) {
        if (token != nullptr && token->cancelled())
          throw connection_error("connect cancelled");
        if (remote_closed_)
          throw connection_error("connection closed before initial state");
        throw connection_error("timed out waiting for initial state");
      }
      policy_.reset();
    } catch (const connection_error &e) {
      spdlog::warn("[htp1] connect: failed to connect and retrieve mso: {}",
                   e.what());
      disconnect();
      throw;
    }

    spdlog::info("[htp1] connected to {}", options_.host);
    subscriptions_.notify(kConnectionSubject);
  }

  void disconnect() {
    std::shared_ptr<websocket> ws;
    std::thread receiver;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      closing_ = true;
      ws = socket_;
      receiver = std::move(receive_thread_);
    }
    if (ws) {
      spdlog::debug("[htp1] disconnect:");
      ws->close();
    }
    join_or_detach(receiver);
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      socket_.reset();
      closing_ = false;
    }
  }

  void reconnect_loop(std::shared_ptr<cancellation> token) {
    spdlog::debug("[htp1] reconnect: started");
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      policy_.reset();
    }
    while (!token->cancelled()) {
      try {
        connect_once(token.get());
        spdlog::debug("[htp1] reconnect: connected");
        break;
      } catch (const connection_error &e) {
        int delay_ms = 0;
        {
          std::lock_guard<std::mutex> lock(state_mu_);
          delay_ms = policy_.next_delay_ms();
        }
        spdlog::debug("[htp1] reconnect: failed ({}), retrying in {} ms",
                      e.what(), delay_ms);
        if (!token->sleep_for(std::chrono::milliseconds(delay_ms))) {
          break;
        }
      } catch (const std::exception &e) {
        // A subscriber threw while being told about the connection.
        spdlog::error("[htp1] reconnect: {}", e.what());
        break;
      }
    }
    spdlog::debug("[htp1] reconnect: exited loop");
    std::lock_guard<std::mutex> lock(task_mu_);
    supervising_ = false;
  }

  void stop_connect() {
    std::thread supervisor;
    std::shared_ptr<cancellation> token;
    {
      std::lock_guard<std::mutex> lock(task_mu_);
      supervisor = std::move(supervisor_);
      token = std::move(supervisor_token_);
    }
    if (token) {
      spdlog::debug("[htp1] stop_connect:");
      token->cancel();
      // Wake a connect_once() waiting for the initial state.
      { std::lock_guard<std::mutex> lock(state_mu_); }
      ready_cv_.notify_all();
    }
    join_or_detach(supervisor);
  }

  void receive_loop(std::shared_ptr<websocket> ws) {
    spdlog::debug("[htp1] receive: started");
    while (true) {
      message msg;
      try {
        msg = ws->receive();
      } catch (const std::exception &e) {
        spdlog::error("[htp1] receive: read failed: {}", e.what());
        msg = message{message::kind::close, {}};
      }
      if (msg.type == message::kind::close) {
        socket_closed();
        break;
      }
      if (msg.type != message::kind::text) {
        continue;
      }
      spdlog::debug("[htp1] receive: msg={}", msg.data.substr(0, 100));
      dispatch(msg.data);
    }
    spdlog::debug("[htp1] receive: exited loop");
  }

  void dispatch(const std::string &text) {
    auto space = text.find(' ');
    std::string command = text.substr(0, space);
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
      spdlog::debug("[htp1] receive: ignoring command '{}'", command);
      return;
    }

    std::string payload =
        space == std::string::npos ? std::string() : text.substr(space + 1);
    try {
      it->second(json::parse(payload));
    } catch (const std::exception &e) {
      spdlog::error("[htp1] receive: handler={} failed: {}", command,
                    e.what());
    }
  }

  void socket_closed() {
    bool local = false;
    bool was_ready = false;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      local = closing_;
      was_ready = ready_;
      remote_closed_ = true;
      if (!local) {
        ready_ = false;
      }
    }
    ready_cv_.notify_all();

    if (local || !was_ready) {
      return;
    }

    spdlog::info("[htp1] connection to {} lost, reconnecting", options_.host);
    try_connect();
    try {
      subscriptions_.notify(kConnectionSubject);
    } catch (const std::exception &e) {
      spdlog::error("[htp1] receive: connection subscriber failed: {}",
                    e.what());
    }
  }

  void handle_mso(const json &payload) {
    if (!payload.is_object()) {
      throw protocol_error("mso payload is not an object");
    }
    spdlog::debug("[htp1] mso: payload=***");
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      mso_ = payload;
      ready_ = true;
    }
    ready_cv_.notify_all();
  }

  void handle_msoupdate(const json &payload) {
    std::vector<patch_result> results;
    {
      std::lock_guard<std::mutex> lock(state_mu_);
      if (!mso_) {
        throw protocol_error("msoupdate before mso");
      }
      results = apply_patch(*mso_, payload);
    }
    spdlog::debug("[htp1] msoupdate: len={}", results.size());
    for (const auto &result : results) {
      spdlog::debug("[htp1] msoupdate: path={}, value={}", result.path,
                    result.after.dump());
      subscriptions_.notify(result.path, result.after);
    }
  }

  client_options options_;
  std::shared_ptr<transport> transport_;
  subscription_registry subscriptions_;
  std::unordered_map<std::string, std::function<void(const json &)>>
      handlers_;

  mutable std::mutex state_mu_;
  std::condition_variable ready_cv_;
  std::optional<json> mso_;
  std::optional<pending_writes> tx_;
  uint64_t next_tx_id_ = 0;
  bool ready_ = false;
  bool remote_closed_ = false;
  bool closing_ = false;
  std::shared_ptr<websocket> socket_;
  std::thread receive_thread_;
  reconnect_policy policy_;

  mutable std::mutex task_mu_;
  std::thread supervisor_;
  std::shared_ptr<cancellation> supervisor_token_;
  bool supervising_ = false;
  bool stopping_ = false;
};

inline bool transaction::commit() {
  if (owner_ == nullptr) {
    throw usage_error("transaction already discarded");
  }
  return owner_->commit_pending(id_);
}

inline void transaction::discard() noexcept {
  if (owner_ != nullptr) {
    owner_->discard_pending(id_);
    owner_ = nullptr;
  }
}

inline bool transaction::active() const {
  return owner_ != nullptr && owner_->transaction_open(id_);
}

} // namespace htp1
