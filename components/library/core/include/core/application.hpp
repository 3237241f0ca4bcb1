/**
 * @file application.hpp
 * @brief Application base class - owns platform bring-up, abstracts details
 */

#pragma once

#include "event_loop.hpp"
#include "nvs_config.hpp"
#include "result.hpp"

namespace core {

/// Application base - derive and implement run()
class Application {
public:
  virtual ~Application() = default;

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;
  Application(Application &&) = delete;
  Application &operator=(Application &&) = delete;

  /// Initialize the platform and run the application
  [[nodiscard]] Status start() {
    if (auto err = init_platform(); !err) {
      return err;
    }
    run();
    return Ok();
  }

protected:
  Application() = default;

  /// Override to implement application logic
  virtual void run() = 0;

  /// Override to customize platform initialization
  virtual Status init_platform() {
    if (auto err = NvsConfigSource::init_partition(); !err) {
      return err;
    }
    return event_loop::init();
  }
};

} // namespace core
