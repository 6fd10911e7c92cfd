#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "http_request.hpp"
#include "http_response.hpp"
#include "raw_buffer.hpp"

enum class SessionState {
  AwaitingData,
  Decoding,
  Dispatching,
  Writing,
  Trimming,
  Closed
};

const char* session_state_name(SessionState s);

using RequestHandler = std::function<ResponseSpec(const ParsedRequest&)>;
// Must not return until every byte is written. false = peer is gone.
using ResponseWriter = std::function<bool(const std::string&)>;
// Called with the status of every response the session writes.
using SessionObserver = std::function<void(int status)>;

// Turns one connection's byte stream into in-order request/response
// exchanges. Owns the connection's accumulator; the socket itself stays with
// the caller, which closes it once state() is Closed.
class ConnectionSession {
 public:
  ConnectionSession(RequestHandler handler, ResponseWriter writer,
                    std::string peer = "-");

  void set_observer(SessionObserver observer);

  // Appends bytes and runs as many exchanges as the buffer allows. Returns
  // AwaitingData or Closed. Never throws.
  SessionState on_data(const char* data, size_t len);

  // Peer hung up: drop whatever is buffered.
  void on_peer_closed();

  SessionState state() const { return state_; }
  size_t buffered() const { return buf_.size(); }
  uint64_t exchanges() const { return exchanges_; }

 private:
  void pump();
  bool dispatch(const ParsedRequest& req, size_t consumed);
  void reject(const std::string& reason);
  bool write(const std::string& wire, int status);
  void notify(int status);
  void close();

  RequestHandler handler_;
  ResponseWriter writer_;
  SessionObserver observer_;
  std::string peer_;
  RawBuffer buf_;
  SessionState state_ = SessionState::AwaitingData;
  uint64_t exchanges_ = 0;
};
