// src/dns/SdBusNetworkd.cpp

#include "SdBusNetworkd.hpp"
#include "Errors.hpp"
#include "configs.hpp"

#include <chrono>
#include <cstring> // strerror

#include <spdlog/spdlog.h>

namespace {

const char *NETWORKD_SERVICE = "org.freedesktop.network1";
const char *NETWORKD_PATH = "/org/freedesktop/network1";
const char *NETWORKD_MANAGER = "org.freedesktop.network1.Manager";

struct MessageDeleter {
  void operator()(sd_bus_message *message) const {
    sd_bus_message_unref(message);
  }
};
using MessagePtr = std::unique_ptr<sd_bus_message, MessageDeleter>;

// frees the sd_bus_error on every path out of a call
class CallError {
public:
  CallError() : error_(SD_BUS_ERROR_NULL) {}
  ~CallError() { sd_bus_error_free(&error_); }

  CallError(const CallError &) = delete;
  CallError &operator=(const CallError &) = delete;

  sd_bus_error *get() { return &error_; }

  SystemBusError toException(const std::string &method, int result) const {
    if (sd_bus_error_is_set(&error_)) {
      return SystemBusError(method + ": " + error_.name + ": " +
                            (error_.message ? error_.message : ""));
    }
    return SystemBusError(method + ": " + std::strerror(-result));
  }

private:
  sd_bus_error error_;
};

void check(int result, const std::string &what) {
  if (result < 0) {
    throw SystemBusError(what + ": " + std::strerror(-result));
  }
}

MessagePtr newManagerCall(sd_bus *bus, const char *method) {
  sd_bus_message *raw = nullptr;
  check(sd_bus_message_new_method_call(bus, &raw, NETWORKD_SERVICE,
                                       NETWORKD_PATH, NETWORKD_MANAGER,
                                       method),
        std::string("create ") + method + " call");
  return MessagePtr(raw);
}

MessagePtr call(sd_bus *bus, sd_bus_message *request, const char *method) {
  const auto timeout_usec = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          SYSTEM_BUS_CALL_TIMEOUT)
          .count());
  CallError error;
  sd_bus_message *reply = nullptr;
  int result = sd_bus_call(bus, request, timeout_usec, error.get(), &reply);
  if (result < 0) {
    throw error.toException(method, result);
  }
  return MessagePtr(reply);
}

} // namespace

SdBusNetworkd::SdBusNetworkd() {
  sd_bus *raw = nullptr;
  int result = sd_bus_open_system(&raw);
  if (result < 0) {
    throw SystemBusError(std::string("open system bus: ") +
                         std::strerror(-result));
  }
  bus_.reset(raw);
  spdlog::debug("Connected to the system bus");
}

int32_t SdBusNetworkd::getLinkByName(const std::string &name) {
  MessagePtr request = newManagerCall(bus_.get(), "GetLinkByName");
  check(sd_bus_message_append(request.get(), "s", name.c_str()),
        "append GetLinkByName arguments");

  MessagePtr reply = call(bus_.get(), request.get(), "GetLinkByName");

  int32_t ifindex = 0;
  const char *object_path = nullptr;
  check(sd_bus_message_read(reply.get(), "io", &ifindex, &object_path),
        "read GetLinkByName reply");

  spdlog::debug("networkd link {} has ifindex {}", name, ifindex);
  return ifindex;
}

void SdBusNetworkd::setLinkDomains(int32_t ifindex,
                                   const std::vector<LinkDomain> &domains) {
  MessagePtr request = newManagerCall(bus_.get(), "SetLinkDomains");

  check(sd_bus_message_append(request.get(), "i", ifindex),
        "append SetLinkDomains ifindex");
  check(sd_bus_message_open_container(request.get(), SD_BUS_TYPE_ARRAY, "(sb)"),
        "open SetLinkDomains array");
  for (const auto &domain : domains) {
    // sd-bus takes booleans as int
    check(sd_bus_message_append(request.get(), "(sb)", domain.name.c_str(),
                                static_cast<int>(domain.routing_only)),
          "append SetLinkDomains domain");
  }
  check(sd_bus_message_close_container(request.get()),
        "close SetLinkDomains array");

  call(bus_.get(), request.get(), "SetLinkDomains");
  spdlog::debug("networkd link {} now has {} domain(s)", ifindex,
                domains.size());
}
