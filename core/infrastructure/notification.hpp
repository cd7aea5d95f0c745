#ifndef CORE_INFRASTRUCTURE_NOTIFICATION_HPP
#define CORE_INFRASTRUCTURE_NOTIFICATION_HPP

#include "concepts.hpp"
#include <functional>
#include <utility>

namespace core {

template <Serializable NotificationType> class Notification {
public:
  using HandlerType = std::function<void(const NotificationType &)>;

  explicit Notification(HandlerType handler) : handler_(std::move(handler)) {}

  void operator()(const NotificationType &notification) const {
    if (handler_) {
      handler_(notification);
    }
  }

  template <typename Predicate>
  Notification<NotificationType> filter(Predicate predicate) const {
    return Notification<NotificationType>(
        [handler = handler_, predicate = std::move(predicate)](
            const NotificationType &notification) {
          if (predicate(notification) && handler) {
            handler(notification);
          }
        });
  }

private:
  HandlerType handler_;
};

template <Serializable T, typename Handler>
auto make_notification(Handler &&handler) {
  return Notification<T>(std::forward<Handler>(handler));
}

} // namespace core

#endif // CORE_INFRASTRUCTURE_NOTIFICATION_HPP
