#pragma once

#include <faceid/pch.hpp>

#include <faceid/app/pipeline_error.hpp>

#include <vector>

namespace faceid {

/**
 * @brief Destination of user-facing notices.
 */
class NoticeSink {
public:
  virtual ~NoticeSink() = default;

  virtual void ShowNotice(const UserNotice& notice) = 0;
};

/**
 * @brief Writes notices to the log. Used in headless mode.
 */
class LogNoticeSink final : public NoticeSink {
public:
  void ShowNotice(const UserNotice& notice) override;
};

/**
 * @brief Keeps every notice in memory.
 */
class RecordingNoticeSink final : public NoticeSink {
public:
  void ShowNotice(const UserNotice& notice) override { notices_.push_back(notice); }

  void Clear() noexcept { notices_.clear(); }

  [[nodiscard]] const std::vector<UserNotice>& Notices() const noexcept { return notices_; }

private:
  std::vector<UserNotice> notices_;
};

}  // namespace faceid
