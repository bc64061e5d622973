#include "Connection.hpp"
#include "Errors.hpp"

Connection::Connection(std::string id, Node& source, Node& target)
: id_(std::move(id)), source_(source), target_(target),
  label_(source.name() + " -> " + target.name()) {}

std::string Connection::channelTag() const {
  auto it = configuration_.find("channelId");
  if (it == configuration_.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

bool Connection::validate() const {
  if (kind_ == "audio") {
    const auto srcFormat = source_.outputFormat();
    if (!srcFormat) {
      throw ConnectionIncompatible(source_.id(), target_.id(),
        "Connection '" + id_ + "': source '" + source_.id() + "' does not declare an output format");
    }
    if (!target_.hasCapability(Capability::AudioInput)) {
      throw ConnectionIncompatible(source_.id(), target_.id(),
        "Connection '" + id_ + "': target '" + target_.id() + "' does not accept audio input");
    }
    if (!target_.isFormatSupported(*srcFormat)) {
      throw ConnectionIncompatible(source_.id(), target_.id(),
        "Connection '" + id_ + "': target '" + target_.id() + "' does not support " + srcFormat->toString());
    }
  }
  return source_.validate() && target_.validate();
}

bool Connection::transferData(const AudioBufferPtr& audio, ProcessingContext& context) {
  if (!enabled_ || !audio) return false;
  if (!target_.hasCapability(Capability::AudioInput)) return false;
  const bool ok = target_.acceptAudio(audio, context);
  if (ok) notifyTransferred(context, audio, {});
  return ok;
}

bool Connection::transferText(const std::string& text, ProcessingContext& context) {
  if (!enabled_) return false;
  const bool ok = target_.acceptText(text, context);
  if (ok) notifyTransferred(context, nullptr, text);
  return ok;
}

void Connection::notifyTransferred(ProcessingContext& context, const AudioBufferPtr& audio, const std::string& text) {
  if (log_) log_->append(TransferRecord{id_, source_.id(), target_.id(), std::chrono::system_clock::now()});
  if (!feed_) return;
  Notification n;
  n.type = NotificationType::DataTransferred;
  n.sourceId = source_.id();
  n.targetId = target_.id();
  n.connectionId = id_;
  n.sessionId = context.sessionId();
  n.audio = audio;
  n.text = text;
  feed_->publish(n);
}
