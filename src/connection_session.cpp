#include "connection_session.hpp"

#include <exception>
#include <utility>

#include "logger.hpp"

static constexpr const char* kTag = "session";
static constexpr const char* kKeepAliveParams = "timeout=5, max=1000";

const char* session_state_name(SessionState s) {
  switch (s) {
    case SessionState::AwaitingData: return "AwaitingData";
    case SessionState::Decoding: return "Decoding";
    case SessionState::Dispatching: return "Dispatching";
    case SessionState::Writing: return "Writing";
    case SessionState::Trimming: return "Trimming";
    case SessionState::Closed: return "Closed";
  }
  return "Closed";
}

ConnectionSession::ConnectionSession(RequestHandler handler,
                                     ResponseWriter writer, std::string peer)
    : handler_(std::move(handler)),
      writer_(std::move(writer)),
      peer_(std::move(peer)) {}

void ConnectionSession::set_observer(SessionObserver observer) {
  observer_ = std::move(observer);
}

SessionState ConnectionSession::on_data(const char* data, size_t len) {
  if (state_ == SessionState::Closed) return state_;

  try {
    buf_.append(data, len);
  } catch (const std::exception& e) {
    reject(std::string("buffer failure: ") + e.what());
    return state_;
  }

  pump();
  return state_;
}

void ConnectionSession::on_peer_closed() {
  if (state_ == SessionState::Closed) return;
  if (!buf_.empty())
    log_debug(peer_ + " closed with " + std::to_string(buf_.size()) +
                  " unprocessed bytes",
              kTag);
  close();
}

// One decode per iteration; loops while pipelined bytes are already buffered
// so a response is always fully written before the next request is decoded.
void ConnectionSession::pump() {
  while (state_ != SessionState::Closed) {
    state_ = SessionState::Decoding;

    DecodeOutcome outcome;
    try {
      outcome = decode_request(buf_.view());
    } catch (const std::exception& e) {
      reject(std::string("decode failure: ") + e.what());
      return;
    }

    if (is_incomplete(outcome)) {
      state_ = SessionState::AwaitingData;
      return;
    }

    if (auto* bad = std::get_if<DecodeInvalid>(&outcome)) {
      reject(bad->reason);
      return;
    }

    const auto& done = std::get<DecodeComplete>(outcome);
    if (!dispatch(done.request, done.bytes_consumed)) return;

    if (buf_.empty()) {
      state_ = SessionState::AwaitingData;
      return;
    }
  }
}

// Returns true when the connection stays open.
bool ConnectionSession::dispatch(const ParsedRequest& req, size_t consumed) {
  state_ = SessionState::Dispatching;
  const bool keep_alive = req.header_equals_ci("connection", "keep-alive");

  std::string wire;
  int status = 0;
  try {
    ResponseSpec resp = handler_(req);
    if (keep_alive) {
      resp.set_header("Connection", "keep-alive");
      resp.set_header("Keep-Alive", kKeepAliveParams);
    } else {
      resp.set_header("Connection", "close");
    }
    status = resp.status;
    wire = encode_response(resp);
  } catch (const std::exception& e) {
    reject(std::string("handler failure: ") + e.what());
    return false;
  } catch (...) {
    reject("handler failure");
    return false;
  }

  if (!write(wire, status)) return false;

  ++exchanges_;
  log_debug(peer_ + " " + method_name(req.method) + " " + req.path + " -> " +
                std::to_string(status) + (keep_alive ? " [keep-alive]" : ""),
            kTag);

  if (!keep_alive) {
    close();
    return false;
  }

  state_ = SessionState::Trimming;
  buf_.consume(consumed);
  return true;
}

bool ConnectionSession::write(const std::string& wire, int status) {
  state_ = SessionState::Writing;

  bool ok = false;
  try {
    ok = writer_(wire);
  } catch (const std::exception& e) {
    reject(std::string("write failure: ") + e.what());
    return false;
  } catch (...) {
    reject("write failure");
    return false;
  }

  if (!ok) {
    log_debug(peer_ + " went away during write", kTag);
    close();
    return false;
  }

  notify(status);
  return true;
}

void ConnectionSession::notify(int status) {
  if (!observer_) return;
  try {
    observer_(status);
  } catch (const std::exception& e) {
    log_warn(std::string("observer failed: ") + e.what(), kTag);
  } catch (...) {
    log_warn("observer failed", kTag);
  }
}

// Malformed input always ends the connection, keep-alive or not.
void ConnectionSession::reject(const std::string& reason) {
  log_warn("bad request from " + peer_ + ": " + reason, kTag);
  state_ = SessionState::Writing;

  try {
    std::string wire =
        encode_response(400, std::string("Bad Request: ") + reason,
                        {{"Content-Type", "text/plain"}, {"Connection", "close"}});
    if (!writer_(wire)) {
      close();
      return;
    }
  } catch (const std::exception& e) {
    log_warn("could not deliver 400 to " + peer_ + ": " + e.what(), kTag);
    close();
    return;
  } catch (...) {
    log_warn("could not deliver 400 to " + peer_, kTag);
    close();
    return;
  }

  notify(400);
  close();
}

void ConnectionSession::close() {
  state_ = SessionState::Closed;
  buf_.clear();
}
