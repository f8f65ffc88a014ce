#pragma once
/**
 * @file consumer.hpp
 * @brief Sink for decoded application messages.
 *
 * Core calls exactly one of these per dispatched envelope, on the thread that
 * called Core::receive(). Implementations must be thread-safe if receive() is
 * driven concurrently.
 *
 * General messages are keyed by the publish topic of their registry entry,
 * or by the type name when the entry has no topic binding (ros_message,
 * ros_service).
 */

#include "body_codec.hpp"
#include "header.hpp"

namespace aclink {

class IConsumer {
public:
  virtual ~IConsumer() = default;

  virtual void on_position_request(const PositionRequest& m, const Header& h) = 0;
  virtual void on_body_request(const BodyRequest& m, const Header& h) = 0;
  virtual void on_nav(const NavStatus& m, const Header& h) = 0;
  virtual void on_string_image(const StringImage& m, const Header& h) = 0;
  virtual void on_ack(const Ack& m, const Header& h) = 0;
  virtual void on_general(const char* topic, const GeneralMessage& m, const Header& h) = 0;
};

} // namespace aclink
