#include <Trickle/stream/source.hxx>

#ifndef WINDOWS
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#endif

using namespace Trickle::Stream;

bool FunctionSource::Interrupt() noexcept {
	return m_interrupt ? m_interrupt() : false;
}

ExpectedData<ReadError> FunctionSource::Read(const std::size_t& count) noexcept {
	if (!m_function)
		return StormByte::Unexpected(ReadError("No read function defined"));

	return m_function(count);
}

#ifndef WINDOWS
FileDescriptorSource::FileDescriptorSource(int fd, bool owned): m_fd(fd), m_owned(owned) {
	if (::pipe2(m_wakeup, O_CLOEXEC | O_NONBLOCK) != 0) {
		throw Error("FileDescriptorSource", "Cannot create wake-up pipe: {}", std::strerror(errno));
	}
}

FileDescriptorSource::~FileDescriptorSource() noexcept {
	::close(m_wakeup[0]);
	::close(m_wakeup[1]);
	if (m_owned && m_fd >= 0)
		::close(m_fd);
}

bool FileDescriptorSource::Interrupt() noexcept {
	const char token = 0;
	ssize_t written;
	do {
		written = ::write(m_wakeup[1], &token, 1);
	} while (written < 0 && errno == EINTR);
	// A full pipe (EAGAIN) already holds a pending wake-up
	return true;
}

ExpectedData<ReadError> FileDescriptorSource::Read(const std::size_t& count) noexcept {
	pollfd fds[2] = {
		{ m_fd, POLLIN, 0 },
		{ m_wakeup[0], POLLIN, 0 }
	};

	while (true) {
		const int rc = ::poll(fds, 2, -1);
		if (rc < 0) {
			if (errno == EINTR)
				continue;
			return StormByte::Unexpected(ReadError("poll failed on descriptor {}: {}", m_fd, std::strerror(errno)));
		}
		if (fds[1].revents != 0)
			return StormByte::Unexpected(ReadError("Read on descriptor {} interrupted", m_fd));
		if (fds[0].revents != 0)
			break;
	}

	DataType data(count);
	ssize_t length;
	do {
		length = ::read(m_fd, data.data(), count);
	} while (length < 0 && errno == EINTR);

	if (length < 0)
		return StormByte::Unexpected(ReadError("read failed on descriptor {}: {}", m_fd, std::strerror(errno)));
	if (length == 0)
		return StormByte::Unexpected(EndOfStream("Descriptor {} reached end of file", m_fd));

	data.resize(static_cast<std::size_t>(length));
	return data;
}
#endif
