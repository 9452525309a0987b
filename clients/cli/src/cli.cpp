#include "rdesk/client.hpp"
#include "rdesk/encoding.hpp"
#include "rdesk/logger.hpp"
#include "rdesk/net.hpp"
#include "rdesk/screen_pipeline.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace rdesk;

static int usage() {
  std::cerr << "Usage: rdesk [--host H] [--port P] --user U <command> [args]\n"
            << "Password is read from RDESK_PASSWORD or the first line of stdin.\n"
            << "Commands:\n"
            << "  ping\n"
            << "  info\n"
            << "  displays\n"
            << "  screenshot <out.ppm> [--format zlib|raw]\n"
            << "  ls [path]\n"
            << "  get <remote> <local>\n"
            << "  put <local> <remote> [--overwrite]\n"
            << "  rm <path>\n"
            << "  move <x> <y>\n"
            << "  click <x> <y> [left|middle|right]\n"
            << "  key <name> [modifier...]\n";
  return 2;
}

static std::string read_password() {
  if (const char *env = std::getenv("RDESK_PASSWORD"))
    return env;
  std::string pw;
  std::getline(std::cin, pw);
  if (!pw.empty() && pw.back() == '\r')
    pw.pop_back();
  return pw;
}

// 32bpp BGRX to binary PPM.
static bool write_ppm(const std::string &path, const ScreenFrame &f,
                      const Bytes &pixels) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    return false;
  out << "P6\n" << f.width << " " << f.height << "\n255\n";
  std::vector<char> row((size_t)f.width * 3);
  for (int y = 0; y < f.height; ++y) {
    const std::uint8_t *src = pixels.data() + (size_t)y * f.width * 4;
    for (int x = 0; x < f.width; ++x) {
      row[(size_t)x * 3 + 0] = (char)src[x * 4 + 2];
      row[(size_t)x * 3 + 1] = (char)src[x * 4 + 1];
      row[(size_t)x * 3 + 2] = (char)src[x * 4 + 0];
    }
    out.write(row.data(), (std::streamsize)row.size());
  }
  return (bool)out;
}

static int run_command(Client &c, const std::vector<std::string> &args) {
  const std::string &cmd = args[0];

  if (cmd == "ping") {
    Bytes echo = c.ping(to_bytes("rdesk"));
    std::cout << "pong: " << to_string(echo) << "\n";
    return 0;
  }

  if (cmd == "info") {
    std::cout << json::dumps(c.info()) << "\n";
    return 0;
  }

  if (cmd == "displays") {
    std::cout << json::dumps(c.system_command("list_displays")) << "\n";
    return 0;
  }

  if (cmd == "screenshot") {
    if (args.size() < 2)
      return usage();
    std::vector<std::string> formats;
    for (size_t i = 2; i + 1 < args.size(); ++i)
      if (args[i] == "--format")
        formats.push_back(args[i + 1]);
    ScreenFrame f = c.screenshot(true, formats);
    auto pixels = decode_frame(f);
    if (!pixels || f.format != "bgra32" ||
        pixels->size() < (size_t)f.width * f.height * 4) {
      std::cerr << "cannot decode " << f.encoding << "/" << f.format
                << " frame\n";
      return 1;
    }
    if (!write_ppm(args[1], f, *pixels)) {
      std::cerr << "cannot write " << args[1] << "\n";
      return 1;
    }
    std::cout << "frame " << f.seq << ": " << f.width << "x" << f.height
              << " (" << f.encoding << ", " << f.bytes.size()
              << " bytes) -> " << args[1] << "\n";
    return 0;
  }

  if (cmd == "ls") {
    json::Object a;
    a["path"] = args.size() > 1 ? args[1] : std::string(".");
    auto r = c.file_op("list", a);
    if (auto *entries = json::get_arr(r, "entries")) {
      for (const auto &e : *entries) {
        if (!e.is_obj())
          continue;
        const auto &o = e.as_obj();
        bool dir = json::get_bool(o, "is_dir").value_or(false);
        std::cout << (dir ? "d " : "- ") << json::get_u64(o, "size").value_or(0)
                  << "\t" << json::get_str(o, "name").value_or("") << "\n";
      }
    }
    return 0;
  }

  if (cmd == "get") {
    if (args.size() < 3)
      return usage();
    c.download(args[1], args[2]);
    std::cout << args[1] << " -> " << args[2] << "\n";
    return 0;
  }

  if (cmd == "put") {
    if (args.size() < 3)
      return usage();
    bool overwrite = args.size() > 3 && args[3] == "--overwrite";
    c.upload(args[1], args[2], overwrite);
    std::cout << args[1] << " -> " << args[2] << "\n";
    return 0;
  }

  if (cmd == "rm") {
    if (args.size() < 2)
      return usage();
    json::Object a;
    a["path"] = args[1];
    c.file_op("delete", a);
    return 0;
  }

  if (cmd == "move") {
    if (args.size() < 3)
      return usage();
    c.mouse_move(std::stoi(args[1]), std::stoi(args[2]));
    // Input has no success reply; a ping flushes any ERROR.
    c.ping({});
    return 0;
  }

  if (cmd == "click") {
    if (args.size() < 3)
      return usage();
    int x = std::stoi(args[1]), y = std::stoi(args[2]);
    MouseButton b = MouseButton::Left;
    if (args.size() > 3) {
      if (args[3] == "middle")
        b = MouseButton::Middle;
      else if (args[3] == "right")
        b = MouseButton::Right;
      else if (args[3] != "left")
        return usage();
    }
    c.mouse_click(x, y, b, true);
    c.mouse_click(x, y, b, false);
    c.ping({});
    return 0;
  }

  if (cmd == "key") {
    if (args.size() < 2)
      return usage();
    std::vector<std::string> mods(args.begin() + 2, args.end());
    c.key(args[1], true, mods);
    c.key(args[1], false, mods);
    c.ping({});
    return 0;
  }

  return usage();
}

int main(int argc, char **argv) {
  std::string host = "127.0.0.1";
  int port = 5000;
  std::string user;
  std::vector<std::string> args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--host" && i + 1 < argc)
        host = argv[++i];
      else if (a == "--port" && i + 1 < argc)
        port = std::stoi(argv[++i]);
      else if (a == "--user" && i + 1 < argc)
        user = argv[++i];
      else if (a == "--log-level" && i + 1 < argc) {
        auto lvl = parse_level(argv[++i]);
        if (!lvl)
          return usage();
        Logger::get().set_level(*lvl);
      } else
        args.push_back(a);
    }
  } catch (const std::logic_error &) {
    return usage();
  }
  if (args.empty() || user.empty())
    return usage();

  try {
    net::NetworkInit netinit;
    Client c;
    c.connect(host, port);
    auto auth = c.authenticate(user, read_password());
    if (!json::get_bool(auth, "success").value_or(false)) {
      std::cerr << "authentication failed: "
                << json::get_str(auth, "error").value_or("unknown") << "\n";
      return 1;
    }
    int rc = run_command(c, args);
    c.disconnect();
    return rc;
  } catch (const ClientError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const PayloadError &e) {
    std::cerr << "bad reply: " << e.what() << "\n";
    return 1;
  } catch (const net::NetError &e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::logic_error &e) {
    std::cerr << "bad argument: " << e.what() << "\n";
    return 2;
  }
}
