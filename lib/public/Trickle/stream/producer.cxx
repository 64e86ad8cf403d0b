#include <Trickle/stream/producer.hxx>

using namespace Trickle::Stream;

Producer::Producer(std::shared_ptr<Source> source, std::shared_ptr<Channel> channel, const std::size_t& block_size):
m_source(std::move(source)), m_channel(std::move(channel)), m_running(std::make_shared<std::atomic<bool>>(true)) {
	m_thread = std::thread(&Producer::Loop, m_source, m_channel, block_size, m_running);
}

Producer::~Producer() noexcept {
	Stop();
}

void Producer::Stop() noexcept {
	if (!m_thread.joinable())
		return;

	m_channel->Cancel();
	if (m_running->load())
		(void)m_source->Interrupt();
	m_thread.join();
}

void Producer::Loop(std::shared_ptr<Source> source, std::shared_ptr<Channel> channel, std::size_t block_size, std::shared_ptr<std::atomic<bool>> running) noexcept {
	std::shared_ptr<ReadError> reason;
	while (!channel->IsCancelled()) {
		auto expected_data = source->Read(block_size);
		if (!expected_data) {
			reason = expected_data.error();
			break;
		}
		if (expected_data->empty())
			continue;
		if (!channel->Send(std::move(*expected_data)))
			break;
	}
	channel->Close(std::move(reason));
	running->store(false);
}
