#include "protocol/mcp_transport.hpp"
#include "protocol/mcp_exception.hpp"
#include "mcp_hub_logging.hpp"
#include "duckdb/common/helper.hpp"
#include "duckdb/common/limits.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <sys/wait.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>

extern char **environ;

namespace duckdb {

// A write to an exited child must surface as EPIPE rather than kill the host
static void IgnoreSigpipe() {
	static std::once_flag once;
	std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

// Host environment with the overlay applied on top; overlay values win
static vector<string> BuildEnvironment(const unordered_map<string, string> &overlay) {
	vector<string> result;
	for (char **env = environ; env && *env; env++) {
		string entry(*env);
		auto eq = entry.find('=');
		auto key = eq == string::npos ? entry : entry.substr(0, eq);
		if (overlay.find(key) != overlay.end()) {
			continue;
		}
		result.push_back(std::move(entry));
	}
	for (auto &env_pair : overlay) {
		result.push_back(env_pair.first + "=" + env_pair.second);
	}
	return result;
}

static void ClosePipe(int fds[2]) {
	for (int i = 0; i < 2; i++) {
		if (fds[i] >= 0) {
			close(fds[i]);
			fds[i] = -1;
		}
	}
}

// Child side: report errno through the status pipe and exit
[[noreturn]] static void ReportChildFailure(int status_fd) {
	int err = errno;
	ssize_t ignored = write(status_fd, &err, sizeof(err));
	(void)ignored;
	_exit(127);
}

MCPDeadline MCPDeadlineAfter(int timeout_seconds) {
	if (timeout_seconds <= 0) {
		return MCPDeadline::max();
	}
	return std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
}

// poll() takes an int; longer waits are split into several polls
static int PollTimeout(MCPDeadline deadline) {
	if (deadline == MCPDeadline::max()) {
		return -1;
	}
	auto remaining =
	    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
	if (remaining <= 0) {
		return 0;
	}
	return static_cast<int>(MinValue<int64_t>(remaining, NumericLimits<int32_t>::Maximum()));
}

StdioTransport::StdioTransport(const StdioConfig &config)
    : config(config), connected(false), torn_down(false), process_pid(-1), stdin_fd(-1), stdout_fd(-1),
      reaped(false) {
}

StdioTransport::~StdioTransport() {
	Disconnect();
}

void StdioTransport::Connect() {
	if (connected) {
		return;
	}
	if (torn_down) {
		throw MCPTransportException("Transport has been shut down: %s", GetConnectionInfo());
	}

	StartProcess();
	connected = true;
}

void StdioTransport::Disconnect() {
	if (torn_down) {
		return;
	}
	torn_down = true;
	connected = false;
	StopProcess();
}

bool StdioTransport::IsConnected() const {
	return connected && IsProcessRunning();
}

void StdioTransport::WriteLine(const string &line) {
	if (!connected || stdin_fd < 0) {
		throw MCPTransportException("Transport not connected: %s", GetConnectionInfo());
	}

	string data = line + "\n";
	const char *ptr = data.c_str();
	size_t remaining = data.size();
	while (remaining > 0) {
		ssize_t written = write(stdin_fd, ptr, remaining);
		if (written < 0) {
			int err = errno;
			if (err == EINTR) {
				continue;
			}
			if (err == EPIPE) {
				throw MCPTransportException("Failed to write to %s: broken pipe", GetConnectionInfo());
			}
			throw MCPTransportException("Failed to write to %s: %s", GetConnectionInfo(), string(strerror(err)));
		}
		ptr += written;
		remaining -= static_cast<size_t>(written);
	}
}

string StdioTransport::ReadLine(MCPDeadline deadline) {
	if (!connected || stdout_fd < 0) {
		throw MCPTransportException("Transport not connected: %s", GetConnectionInfo());
	}

	while (true) {
		auto newline = read_buffer.find('\n');
		if (newline != string::npos) {
			string line = read_buffer.substr(0, newline);
			read_buffer.erase(0, newline + 1);
			if (!line.empty() && line.back() == '\r') {
				line.pop_back();
			}
			return line;
		}

		if (!WaitForData(PollTimeout(deadline))) {
			if (std::chrono::steady_clock::now() < deadline) {
				continue;
			}
			throw MCPTimeoutException("Timed out waiting for a response from %s", GetConnectionInfo());
		}

		char buffer[4096];
		ssize_t bytes_read = read(stdout_fd, buffer, sizeof(buffer));
		if (bytes_read > 0) {
			read_buffer.append(buffer, static_cast<size_t>(bytes_read));
			continue;
		}
		if (bytes_read == 0) {
			// EOF: hand out a trailing unterminated line once, then fail
			if (!read_buffer.empty()) {
				string line;
				line.swap(read_buffer);
				if (line.back() == '\r') {
					line.pop_back();
				}
				return line;
			}
			throw MCPTransportException("MCP server closed its output: %s", GetConnectionInfo());
		}
		int err = errno;
		if (err == EINTR || err == EAGAIN) {
			continue;
		}
		throw MCPTransportException("Failed to read from %s: %s", GetConnectionInfo(), string(strerror(err)));
	}
}

MCPDeadline StdioTransport::GetReadDeadline() const {
	return MCPDeadlineAfter(config.timeout_seconds);
}

string StdioTransport::GetConnectionInfo() const {
	return "stdio://" + config.command_path + " (pid: " + std::to_string(process_pid) + ")";
}

void StdioTransport::StartProcess() {
	if (config.command_path.empty()) {
		throw MCPTransportException("Cannot start MCP server: command is empty");
	}
	IgnoreSigpipe();

	// Everything the child touches is built before fork
	vector<string> arg_storage;
	arg_storage.push_back(config.command_path);
	for (auto &arg : config.arguments) {
		arg_storage.push_back(arg);
	}
	vector<char *> argv;
	for (auto &arg : arg_storage) {
		argv.push_back(const_cast<char *>(arg.c_str()));
	}
	argv.push_back(nullptr);

	auto env_storage = BuildEnvironment(config.environment);
	vector<char *> envp;
	for (auto &entry : env_storage) {
		envp.push_back(const_cast<char *>(entry.c_str()));
	}
	envp.push_back(nullptr);

	const char *cwd = config.working_directory.empty() ? nullptr : config.working_directory.c_str();

	int stdin_pipe[2] = {-1, -1};
	int stdout_pipe[2] = {-1, -1};
	int status_pipe[2] = {-1, -1};
	if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
	    pipe2(status_pipe, O_CLOEXEC) != 0) {
		int err = errno;
		ClosePipe(stdin_pipe);
		ClosePipe(stdout_pipe);
		ClosePipe(status_pipe);
		throw MCPTransportException("Failed to create pipes for '%s': %s", config.command_path, string(strerror(err)));
	}

	int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
	if (devnull < 0) {
		int err = errno;
		ClosePipe(stdin_pipe);
		ClosePipe(stdout_pipe);
		ClosePipe(status_pipe);
		throw MCPTransportException("Failed to open /dev/null for '%s': %s", config.command_path,
		                            string(strerror(err)));
	}

	pid_t pid = fork();
	if (pid < 0) {
		int err = errno;
		ClosePipe(stdin_pipe);
		ClosePipe(stdout_pipe);
		ClosePipe(status_pipe);
		close(devnull);
		throw MCPTransportException("Failed to fork for '%s': %s", config.command_path, string(strerror(err)));
	}

	if (pid == 0) {
		// Child process: async-signal-safe calls only
		if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 || dup2(stdout_pipe[1], STDOUT_FILENO) < 0 ||
		    dup2(devnull, STDERR_FILENO) < 0) {
			ReportChildFailure(status_pipe[1]);
		}
		if (cwd && chdir(cwd) != 0) {
			ReportChildFailure(status_pipe[1]);
		}
		// SIG_IGN survives exec; the server gets the default disposition back
		signal(SIGPIPE, SIG_DFL);
		execvpe(argv[0], argv.data(), envp.data());
		ReportChildFailure(status_pipe[1]);
	}

	// Parent process
	close(stdin_pipe[0]);
	close(stdout_pipe[1]);
	close(status_pipe[1]);
	close(devnull);

	// The status pipe closes on a successful exec and carries errno otherwise
	int child_errno = 0;
	ssize_t status_bytes;
	do {
		status_bytes = read(status_pipe[0], &child_errno, sizeof(child_errno));
	} while (status_bytes < 0 && errno == EINTR);
	close(status_pipe[0]);

	if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
		close(stdin_pipe[1]);
		close(stdout_pipe[0]);
		int status;
		while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
		}
		throw MCPTransportException("Failed to start MCP server process '%s': %s", config.command_path,
		                            string(strerror(child_errno)));
	}

	process_pid = pid;
	stdin_fd = stdin_pipe[1];
	stdout_fd = stdout_pipe[0];
	reaped = false;

	MCP_HUB_LOG_DEBUG("TRANSPORT", "Started %s", GetConnectionInfo());
}

void StdioTransport::CloseDescriptors() {
	if (stdin_fd >= 0) {
		close(stdin_fd);
		stdin_fd = -1;
	}
	if (stdout_fd >= 0) {
		close(stdout_fd);
		stdout_fd = -1;
	}
	read_buffer.clear();
}

void StdioTransport::StopProcess() {
	CloseDescriptors();

	if (process_pid <= 0 || reaped) {
		return;
	}

	kill(process_pid, SIGKILL);

	int status = 0;
	pid_t result;
	do {
		result = waitpid(process_pid, &status, 0);
	} while (result < 0 && errno == EINTR);

	reaped = true;
	MCP_HUB_LOG_DEBUG("TRANSPORT", "Stopped %s", GetConnectionInfo());
}

bool StdioTransport::IsProcessRunning() const {
	if (process_pid <= 0 || reaped) {
		return false;
	}

	int status;
	pid_t result = waitpid(process_pid, &status, WNOHANG);
	if (result == 0) {
		return true;
	}
	// Exited, or already collected elsewhere: never signal this pid again
	reaped = true;
	return false;
}

bool StdioTransport::WaitForData(int timeout_ms) {
	struct pollfd pfd;
	pfd.fd = stdout_fd;
	pfd.events = POLLIN;
	pfd.revents = 0;

	int result;
	do {
		result = poll(&pfd, 1, timeout_ms);
	} while (result < 0 && errno == EINTR);

	if (result < 0) {
		int err = errno;
		throw MCPTransportException("Failed to poll %s: %s", GetConnectionInfo(), string(strerror(err)));
	}
	// POLLHUP is reported as readable so the next read observes EOF
	return result > 0;
}

} // namespace duckdb
