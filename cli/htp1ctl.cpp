#include "htp1/htp1.hpp"

#include <spdlog/cfg/env.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int) { g_interrupted.store(true); }

void usage() {
  std::fprintf(stderr,
               "usage: htp1ctl --host HOST [--power on|off] [--volume DB]\n"
               "               [--mute on|off] [--input LABEL] [--upmix NAME]\n"
               "               [--watch] [--verbose]\n"
               "               [--mso-timeout MS] [--connect-timeout MS]\n"
               "               [--reconnect-initial MS] [--reconnect-max MS]\n");
}

struct changes {
  std::optional<bool> power;
  std::optional<double> volume;
  std::optional<bool> mute;
  std::optional<std::string> input;
  std::optional<std::string> upmix;
  bool watch = false;
  bool verbose = false;

  bool any() const { return power || volume || mute || input || upmix; }
};

bool parse_switch(const std::string &text) {
  if (text == "on")
    return true;
  if (text == "off")
    return false;
  throw std::invalid_argument("expected on or off, got '" + text + "'");
}

changes parse_changes(const std::vector<std::string> &args) {
  changes c;
  for (size_t i = 0; i < args.size(); ++i) {
    const auto &flag = args[i];
    if (flag == "--watch") {
      c.watch = true;
      continue;
    }
    if (flag == "--verbose") {
      c.verbose = true;
      continue;
    }
    if (i + 1 >= args.size())
      continue;
    const auto &value = args[i + 1];
    if (flag == "--power")
      c.power = parse_switch(value);
    else if (flag == "--volume")
      c.volume = std::stod(value);
    else if (flag == "--mute")
      c.mute = parse_switch(value);
    else if (flag == "--input")
      c.input = value;
    else if (flag == "--upmix")
      c.upmix = value;
    else
      continue;
    ++i;
  }
  return c;
}

std::string join(const std::vector<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty())
      out += ", ";
    out += item;
  }
  return out;
}

void print_status(const htp1::client &dev) {
  auto power = dev.power();
  std::printf("serial:  %s\n", dev.serial_number().c_str());
  std::printf("power:   %s\n",
              !power ? "unknown" : (*power ? "on" : "off"));
  std::printf("volume:  %.1f dB (%.0f%%)\n", dev.volume(),
              dev.volume_level() * 100.0);
  std::printf("muted:   %s\n", dev.muted() ? "yes" : "no");
  std::printf("input:   %s\n", dev.input().c_str());
  std::printf("upmix:   %s\n", dev.upmix().c_str());
  std::printf("inputs:  %s\n", join(dev.inputs()).c_str());
  std::printf("upmixes: %s\n", join(dev.upmixes()).c_str());
}

void apply(htp1::client &dev, const changes &c) {
  auto tx = dev.begin_transaction();
  if (c.power)
    dev.set_power(*c.power);
  if (c.volume)
    dev.set_volume(*c.volume);
  if (c.mute)
    dev.set_muted(*c.mute);
  if (c.input)
    dev.set_input(*c.input);
  if (c.upmix)
    dev.set_upmix(*c.upmix);
  if (tx.commit())
    spdlog::info("[htp1ctl] changes sent");
}

int watch(htp1::client &dev) {
  for (const auto *path : {"/powerIsOn", "/volume", "/muted", "/input",
                           "/upmix/select"}) {
    std::string subject = path;
    dev.subscribe(subject, [subject](const htp1::json &value) {
      spdlog::info("[htp1ctl] {} = {}", subject, value.dump());
    });
  }
  dev.subscribe(htp1::kConnectionSubject, [&dev](const htp1::json &) {
    spdlog::info("[htp1ctl] {}", dev.connected() ? "connected" : "disconnected");
  });

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  dev.try_connect();
  while (!g_interrupted.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  dev.stop();
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  spdlog::cfg::load_env_levels();

  htp1::client_options opts;
  changes wanted;
  try {
    opts = htp1::parse_flags(args);
    wanted = parse_changes(args);
  } catch (const std::exception &e) {
    std::fprintf(stderr, "htp1ctl: %s\n", e.what());
    usage();
    return 2;
  }
  if (opts.host.empty()) {
    usage();
    return 2;
  }
  if (wanted.verbose) {
    spdlog::set_level(spdlog::level::debug);
  }

  htp1::client dev(opts);
  if (wanted.watch) {
    return watch(dev);
  }

  try {
    dev.connect();
    if (wanted.any()) {
      apply(dev, wanted);
    }
    print_status(dev);
  } catch (const std::exception &e) {
    spdlog::error("[htp1ctl] {}", e.what());
    return 1;
  }
  dev.stop();
  return 0;
}
