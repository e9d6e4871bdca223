#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace herald::notifier {

enum class urgency_e {
  LOW = 0,
  NORMAL = 1,
  CRITICAL = 2,
};

std::optional<urgency_e> parse_urgency(std::string_view name);
std::string_view to_string(urgency_e urgency);

// A desktop notification sink
class notifier_if {
public:
  virtual ~notifier_if() = default;
  // Returns false when the notification could not be delivered
  virtual bool notify(const std::string &app_name, const std::string &body,
                      urgency_e urgency) = 0;
};

using notifier_t = std::shared_ptr<notifier_if>;

// Runs `notify-send` and waits for it
class notify_send_c : public notifier_if {
public:
  explicit notify_send_c(std::string program = "notify-send");
  bool notify(const std::string &app_name, const std::string &body,
              urgency_e urgency) override;

private:
  std::string program_;
};

} // namespace herald::notifier
