#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <linux/input-event-codes.h>

#include <ConfigFile.hpp>
#include <DeviceCatalog.hpp>
#include <Errors.hpp>
#include <EvdevDeviceProvider.hpp>
#include <EvdevEventSource.hpp>
#include <Log.hpp>
#include <Session.hpp>
#include <Validator.hpp>

namespace {

  volatile std::sig_atomic_t _interrupted = 0;

  void on_signal(int) {
    _interrupted = 1;
  }

  int usage() {
    std::cerr << "usage: remapedit [--log-level LEVEL] list" << std::endl
              << "       remapedit [--log-level LEVEL] log DEVICE" << std::endl
              << "       remapedit [--log-level LEVEL] check CONFIG [DEVICE]" << std::endl;
    return 2;
  }

  int list_devices(rme::DeviceCatalog &catalog) {
    for (const auto &device : catalog.enumerate()) {
      std::cout << device.id << "\t" << device.name;
      if (device.phys)
        std::cout << "\t" << *device.phys;
      if (!device.available) {
        std::cout << "\t(unavailable)" << std::endl;
        continue;
      }

      const auto &caps = device.capabilities;
      std::cout << "\t" << caps.codes(EV_KEY).size() << " keys, "
                << caps.codes(EV_REL).size() + caps.codes(EV_ABS).size() << " axes"
                << std::endl;
    }
    return 0;
  }

  void print_item(const rme::CaptureItem &item) {
    if (const auto *event = std::get_if<rme::RawEvent>(&item)) {
      std::cout << event->sequence << "\t"
                << rme::event_type_name(event->type) << "\t"
                << event->describe() << "\t"
                << rme::category_name(event->category) << std::endl;
    } else {
      const auto &gap = std::get<rme::CaptureGap>(item);
      std::cout << gap.first_missing << "\t-- ";
      if (gap.missing_count)
        std::cout << gap.missing_count << " events lost --" << std::endl;
      else
        std::cout << "events lost --" << std::endl;
    }
  }

  int log_events(rme::DeviceCatalog &catalog, rme::EventSource &source, const std::string &id) {
    catalog.enumerate();
    const auto device = catalog.find(id);
    if (!device) {
      std::cerr << "No such input device: " << id << std::endl;
      return 1;
    }

    rme::Session session(source);
    session.on_capture_appended([](const rme::CaptureLog &log, std::size_t added) {
      const auto &entries = log.get_entries();
      const auto first = entries.size() - std::min(added, entries.size());
      for (auto i = first; i < entries.size(); ++i)
        print_item(entries[i]);
    });

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "===== Logging " << device->label << " (Ctrl-C to stop) =====" << std::endl;
    session.start_capture(*device);
    while (!_interrupted && session.is_capturing()) {
      session.pump_events();
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    session.stop_capture();

    if (!_interrupted)
      std::cerr << "Device went away" << std::endl;
    return 0;
  }

  std::optional<rme::Device> resolve_device(rme::DeviceCatalog &catalog, const rme::RuleSet &rule_set,
                                            const std::optional<std::string> &id) {
    try {
      catalog.enumerate();
    } catch (const rme::DeviceEnumerationError &e) {
      if (id)
        throw;
      REMAPEDIT_LOG_WARN("Checking without a device: " << e.what());
      return std::nullopt;
    }

    if (id) {
      auto device = catalog.find(*id);
      if (!device)
        throw rme::DeviceQueryError("No such input device: " + *id);
      return device;
    }
    return catalog.resolve(rule_set.get_device_selector());
  }

  int check_config(rme::DeviceCatalog &catalog, const std::string &path,
                   const std::optional<std::string> &id) {
    const auto rule_set = rme::load_rule_set(path);
    const auto device = resolve_device(catalog, rule_set, id);
    if (device)
      std::cout << "Checking against " << device->label << std::endl;

    const auto diagnostics = rme::validate(rule_set, device ? &*device : nullptr);
    for (const auto &diagnostic : diagnostics) {
      std::cout << rme::severity_name(diagnostic.severity) << ": ";
      if (diagnostic.entry)
        std::cout << "entry " << *diagnostic.entry + 1 << ": ";
      std::cout << diagnostic.message
                << " [" << rme::diagnostic_kind_name(diagnostic.kind) << "]" << std::endl;
    }

    std::cout << rme::count_severity(diagnostics, rme::Severity::Error) << " errors, "
              << rme::count_severity(diagnostics, rme::Severity::Warning) << " warnings"
              << std::endl;
    return rme::is_save_ready(diagnostics) ? 0 : 1;
  }

}

int main(int argc, char **argv) {
  rme::log::init_from_env();

  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() >= 2 && args[0] == "--log-level") {
    const auto level = rme::log::parse_level(args[1]);
    if (!level) {
      std::cerr << "Unknown log level: " << args[1] << std::endl;
      return usage();
    }
    rme::log::set_level(*level);
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty())
    return usage();

  rme::EvdevDeviceProvider provider;
  rme::EvdevEventSource source;
  rme::DeviceCatalog catalog(provider);

  const auto &command = args[0];
  try {
    if (command == "list" && args.size() == 1)
      return list_devices(catalog);
    if (command == "log" && args.size() == 2)
      return log_events(catalog, source, args[1]);
    if (command == "check" && (args.size() == 2 || args.size() == 3)) {
      std::optional<std::string> id;
      if (args.size() == 3)
        id = args[2];
      return check_config(catalog, args[1], id);
    }
  } catch (const rme::ParseError &e) {
    std::cerr << args[1] << ":" << e.get_line() << ": " << e.get_reason() << std::endl;
    return 1;
  } catch (const std::runtime_error &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return usage();
}
