#include "cuerpo/osc_sink.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

namespace cuerpo {

namespace osc {

namespace {

void pad4(std::vector<uint8_t>& out) {
    while (out.size() % 4 != 0) out.push_back(0);
}

// OSC string: bytes, at least one NUL, padded to 4
void write_string(std::vector<uint8_t>& out, const std::string& s) {
    out.insert(out.end(), s.begin(), s.end());
    out.push_back(0);
    pad4(out);
}

void write_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

} // namespace

std::vector<uint8_t> encode_message(const std::string& address, const std::vector<Argument>& args) {
    std::vector<uint8_t> out;
    write_string(out, address);

    std::string tags = ",";
    for (const auto& a : args) tags.push_back(a.tag);
    write_string(out, tags);

    for (const auto& a : args) {
        if (a.tag == 'f') {
            uint32_t bits;
            std::memcpy(&bits, &a.f, sizeof(bits));
            write_u32(out, bits);
        } else {
            write_u32(out, static_cast<uint32_t>(a.i));
        }
    }
    return out;
}

std::vector<uint8_t> encode_bundle(const std::vector<std::vector<uint8_t>>& elements, uint64_t timetag) {
    std::vector<uint8_t> out;
    write_string(out, "#bundle");
    write_u32(out, static_cast<uint32_t>(timetag >> 32));
    write_u32(out, static_cast<uint32_t>(timetag & 0xffffffffu));
    for (const auto& e : elements) {
        write_u32(out, static_cast<uint32_t>(e.size()));
        out.insert(out.end(), e.begin(), e.end());
    }
    return out;
}

} // namespace osc

OscSink::OscSink(const OscSinkConfig& config)
    : config_(config) {}

OscSink::~OscSink() { close(); }

bool OscSink::open() {
    last_error_.clear();
    if (fd_ >= 0) return true;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC; // allow IPv4 or IPv6
    hints.ai_socktype = SOCK_DGRAM;
    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(config_.port);
    int rc = getaddrinfo(config_.host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        last_error_ = std::string("getaddrinfo: ") + gai_strerror(rc);
        std::cerr << "[OscSink] " << last_error_ << "\n";
        return false;
    }

    for (struct addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
        int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (fd < 0) {
            last_error_ = std::string("socket: ") + std::strerror(errno);
            continue;
        }
        fd_ = fd;
        const uint8_t* raw = reinterpret_cast<const uint8_t*>(rp->ai_addr);
        addr_.assign(raw, raw + rp->ai_addrlen);
        break;
    }
    freeaddrinfo(res);

    if (fd_ < 0) {
        std::cerr << "[OscSink] " << last_error_ << "\n";
        return false;
    }
    if (config_.verbose) {
        std::cerr << "[OscSink] Sending to " << config_.host << ":" << config_.port
                  << (config_.bundle_parameters ? " (bundled)" : "") << "\n";
    }
    return true;
}

void OscSink::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    pending_bundle_.clear();
}

bool OscSink::send_packet(const std::vector<uint8_t>& packet) {
    if (fd_ < 0) {
        last_error_ = "socket not open";
        return false;
    }
    ssize_t n = ::sendto(fd_, packet.data(), packet.size(), MSG_DONTWAIT,
                         reinterpret_cast<const struct sockaddr*>(addr_.data()),
                         static_cast<socklen_t>(addr_.size()));
    if (n < 0) {
        // EAGAIN means the socket buffer is full; the caller decides whether to retry
        last_error_ = std::string("sendto: ") + std::strerror(errno);
        if (config_.verbose) std::cerr << "[OscSink] " << last_error_ << "\n";
        return false;
    }
    packets_sent_++;
    return static_cast<size_t>(n) == packet.size();
}

bool OscSink::send_parameter(const std::string& name, float value) {
    auto msg = osc::encode_message("/motion/" + name, {osc::Argument::from_float(value)});
    if (config_.bundle_parameters) {
        pending_bundle_.push_back(std::move(msg));
        return true;
    }
    return send_packet(msg);
}

bool OscSink::send_note_on(int voice, int pitch, int velocity) {
    return send_packet(osc::encode_message("/note/on", {
        osc::Argument::from_int(voice),
        osc::Argument::from_int(pitch),
        osc::Argument::from_int(velocity)
    }));
}

bool OscSink::send_note_off(int voice) {
    return send_packet(osc::encode_message("/note/off", {osc::Argument::from_int(voice)}));
}

bool OscSink::send_control_change(const std::string& name, float value, int voice) {
    std::string address = voice < 0 ? "/control/" + name
                                     : "/voice/" + std::to_string(voice) + "/" + name;
    return send_packet(osc::encode_message(address, {osc::Argument::from_float(value)}));
}

bool OscSink::flush() {
    if (pending_bundle_.empty()) return true;
    auto bundle = osc::encode_bundle(pending_bundle_);
    pending_bundle_.clear();
    return send_packet(bundle);
}

std::string OscSink::name() const {
    return "osc://" + config_.host + ":" + std::to_string(config_.port);
}

} // namespace cuerpo
