#include <Trickle/stream/channel.hxx>

using namespace Trickle::Stream;

void Channel::Cancel() noexcept {
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
		m_cancelled = true;
		m_slot.reset();
	}
	m_cv.notify_all();
}

void Channel::Close(std::shared_ptr<ReadError> reason) noexcept {
	{
		std::scoped_lock<std::mutex> lock(m_mutex);
		if (m_closed)
			return;
		m_closed = true;
		m_reason = std::move(reason);
	}
	m_cv.notify_all();
}

std::shared_ptr<ReadError> Channel::CloseReason() const noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	return m_reason;
}

bool Channel::IsCancelled() const noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	return m_cancelled;
}

bool Channel::IsClosed() const noexcept {
	std::scoped_lock<std::mutex> lock(m_mutex);
	return m_closed;
}

Channel::Status Channel::Receive(DataType& out, const Duration& timeout) noexcept {
	std::unique_lock<std::mutex> lock(m_mutex);
	if (timeout > Duration::zero()) {
		m_cv.wait_for(lock, timeout, [this] {
			return m_slot.has_value() || m_closed || m_cancelled;
		});
	}

	if (m_slot.has_value()) {
		out = std::move(*m_slot);
		m_slot.reset();
		lock.unlock();
		// Release the sender waiting for the handoff
		m_cv.notify_all();
		return Status::Received;
	}

	if (m_closed || m_cancelled)
		return Status::Closed;

	return Status::Timeout;
}

bool Channel::Send(DataType&& chunk) noexcept {
	std::unique_lock<std::mutex> lock(m_mutex);
	if (m_closed || m_cancelled)
		return false;

	m_slot = std::move(chunk);
	m_cv.notify_all();
	m_cv.wait(lock, [this] {
		return !m_slot.has_value() || m_cancelled;
	});
	// Cancel() empties the slot too, so a cancelled handoff counts as failed
	return !m_cancelled;
}
