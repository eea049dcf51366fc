// wifi-proxy
// - Associates a secondary (usually USB) Wi-Fi adapter with a device's access point
//   while the primary interface stays on the normal network.
// - Serves the device's MJPEG stream and a keyboard/gamepad control channel to
//   browsers on the primary network (uWebSockets), relaying through the secondary link.
// - Keeps saved networks in a JSON config file.

#include "credential_store.h"
#include "errors.h"
#include "gateway_client.h"
#include "gateway_command_sink.h"
#include "iface_controller.h"
#include "mjpeg_source.h"
#include "net_util.h"
#include "nmcli_backend.h"
#include "proxy_gateway.h"
#include "settings.h"
#include "stream_relay.h"

#include <popt.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;
using namespace wifiproxy;

enum ExitCode {
    EXIT_OK = 0,
    EXIT_IFACE = 1,
    EXIT_CONFIG = 2,
    EXIT_USAGE = 3,
    EXIT_GATEWAY = 4
};

struct CliOptions {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> iface;
    std::optional<std::string> password;
    bool save = false;
    int port = 8080;
    std::optional<std::string> ssid;
    std::string output = "gateway.html";
    std::string url = "/";
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

static std::atomic<bool> shuttingDown{false};

static const char *kCommands =
    "Commands:\n"
    "  list-interfaces                 Wi-Fi adapters known to the host\n"
    "  scan [-i IFACE]                 Visible networks, strongest first\n"
    "  connect SSID [-p PW] [-i IFACE] [-s]\n"
    "  status [-i IFACE]\n"
    "  disconnect [-i IFACE]\n"
    "  serve [-P PORT] [-i IFACE] [--ssid SSID [-p PW]]\n"
    "  save-network SSID -p PW [-i IFACE]\n"
    "  show-config\n"
    "  fetch-gateway [-o FILE] [-u PATH] [-i IFACE]\n";

// ----------------- CLI -----------------
static CliOptions parseCli(int argc, const char **argv) {
    char *opt_iface = nullptr;
    char *opt_password = nullptr;
    int opt_save = 0;
    int opt_port = 8080;
    char *opt_ssid = nullptr;
    char *opt_output = nullptr;
    char *opt_url = nullptr;
    int opt_help = 0;

    struct poptOption optionsTable[] = {
        { "interface", 'i', POPT_ARG_STRING, &opt_iface,    0, "Secondary Wi-Fi interface", "IFACE" },
        { "password",  'p', POPT_ARG_STRING, &opt_password, 0, "Network password", "PASSWORD" },
        { "save",      's', POPT_ARG_NONE,   &opt_save,     0, "Save the credential after a successful connect", nullptr },
        { "port",      'P', POPT_ARG_INT,    &opt_port,     0, "HTTP listen port for serve", "PORT" },
        { "ssid",      0,   POPT_ARG_STRING, &opt_ssid,     0, "Connect to SSID before serving", "SSID" },
        { "output",    'o', POPT_ARG_STRING, &opt_output,   0, "Output file for fetch-gateway", "FILE" },
        { "url",       'u', POPT_ARG_STRING, &opt_url,      0, "Device path for fetch-gateway", "PATH" },
        { "help",      'h', POPT_ARG_NONE,   &opt_help,     'h', "Help", nullptr },
        { nullptr, 0, 0, nullptr, 0, nullptr, nullptr }
    };
    poptContext pc = poptGetContext(argv[0], argc, argv, optionsTable, 0);
    poptSetOtherOptionHelp(pc, "COMMAND [ARGS]");
    int rc;
    while ((rc = poptGetNextOpt(pc)) >= 0) {
        if (rc == 'h') opt_help = 1;
    }
    if (rc < -1) {
        std::string msg = std::string(poptBadOption(pc, POPT_BADOPTION_NOALIAS)) + ": " + poptStrerror(rc);
        poptPrintUsage(pc, stderr, 0);
        poptFreeContext(pc);
        throw UsageError(msg);
    }
    if (opt_help) {
        poptPrintHelp(pc, stdout, 0);
        std::cout << "\n" << kCommands;
        poptFreeContext(pc);
        std::exit(EXIT_OK);
    }

    CliOptions o;
    std::vector<std::string> pos;
    while (const char *a = poptGetArg(pc)) pos.emplace_back(a);
    poptFreeContext(pc);

    if (pos.empty()) throw UsageError("missing command");
    o.command = pos.front();
    o.args.assign(pos.begin() + 1, pos.end());
    if (opt_iface && *opt_iface) o.iface = std::string(opt_iface);
    if (opt_password) o.password = std::string(opt_password);
    o.save = opt_save != 0;
    o.port = opt_port;
    if (opt_ssid && *opt_ssid) o.ssid = std::string(opt_ssid);
    if (opt_output && *opt_output) o.output = opt_output;
    if (opt_url && *opt_url) o.url = opt_url;

    if (o.port <= 0 || o.port > 65535) throw UsageError("--port must be 1..65535");
    if (!startsWith(o.url, "/")) o.url = "/" + o.url;
    return o;
}

static void requireArgs(const CliOptions &o, size_t n, const char *what) {
    if (o.args.size() != n) throw UsageError(std::string(o.command) + " expects " + what);
}

// ----------------- output -----------------
static void printStatus(const InterfaceStatus &st) {
    std::cout << "Interface:  " << st.name << "\n"
              << "State:      " << toString(st.state) << "\n"
              << "SSID:       " << st.ssid.value_or("-") << "\n"
              << "Address:    " << st.localAddress.value_or("-") << "\n"
              << "Gateway:    " << st.gatewayAddress.value_or("-") << "\n";
    if (st.lastError) std::cout << "Last error: " << *st.lastError << "\n";
}

static std::string signalBars(int signal) {
    std::string bars;
    for (int t : {20, 40, 60, 80}) bars += (signal >= t) ? '#' : '.';
    return bars;
}

static std::string mask(const std::string &pw) {
    return std::string(std::min<size_t>(pw.size(), 12), '*');
}

// ----------------- commands -----------------
static int cmdListInterfaces(InterfaceController &ctl, CredentialStore &store) {
    auto devs = ctl.listInterfaces();
    if (devs.empty()) {
        std::cout << "No Wi-Fi interfaces found\n";
        return EXIT_OK;
    }
    const auto def = store.defaultInterface();
    std::cout << std::left << std::setw(16) << "INTERFACE" << std::setw(16) << "STATE" << "BUS\n";
    for (auto &d : devs) {
        std::cout << std::left << std::setw(16) << d.name << std::setw(16) << d.state << (d.usb ? "usb" : "-");
        if (def && *def == d.name) std::cout << " (default)";
        std::cout << "\n";
    }
    return EXIT_OK;
}

static int cmdScan(InterfaceController &ctl, const std::string &iface) {
    auto aps = ctl.scan(iface);
    if (aps.empty()) {
        std::cout << "No networks visible on " << iface << "\n";
        return EXIT_OK;
    }
    std::cout << "   " << std::left << std::setw(33) << "SSID" << std::setw(8) << "SIGNAL" << "SECURITY\n";
    for (auto &ap : aps) {
        std::cout << (ap.inUse ? " * " : "   ") << std::left << std::setw(33) << ap.ssid
                  << std::setw(8) << (std::to_string(ap.signal) + " " + signalBars(ap.signal))
                  << (ap.security.empty() ? "open" : ap.security) << "\n";
    }
    return EXIT_OK;
}

static int cmdShowConfig(CredentialStore &store) {
    std::cout << "Config file:       " << store.path() << "\n"
              << "Default interface: " << store.defaultInterface().value_or("(auto)") << "\n";
    auto nets = store.networks();
    if (nets.empty()) {
        std::cout << "No saved networks\n";
        return EXIT_OK;
    }
    std::cout << "Saved networks:\n";
    for (auto &n : nets) {
        std::cout << "  " << n.ssid << "  password=" << mask(n.password)
                  << "  interface=" << (n.interfaceName.empty() ? "(any)" : n.interfaceName) << "\n";
    }
    return EXIT_OK;
}

static int cmdSaveNetwork(const CliOptions &o, CredentialStore &store) {
    requireArgs(o, 1, "an SSID");
    if (!o.password) throw UsageError("save-network requires --password");
    store.put(NetworkCredential{o.args[0], *o.password, o.iface.value_or("")});
    store.save();
    std::cout << "[main] Saved network " << o.args[0] << " to " << store.path() << "\n";
    return EXIT_OK;
}

static GatewayClient makeClient(const InterfaceStatus &st, const Settings &settings) {
    GatewayEndpoint ep;
    ep.host = *st.gatewayAddress;
    ep.httpPort = settings.gatewayHttpPort;
    ep.bindAddress = st.localAddress.value_or("");
    ep.bindDevice = st.name;
    GatewayOptions opts;
    opts.connectTimeoutMs = settings.connectTimeoutMs;
    opts.readTimeoutMs = settings.readTimeoutMs;
    return GatewayClient(ep, opts);
}

static bool requireLink(const InterfaceStatus &st) {
    const std::string problem = linkProblem(st);
    if (!problem.empty()) {
        std::cerr << "[main] " << problem << "\n";
        return false;
    }
    return true;
}

static int cmdFetchGateway(const CliOptions &o, InterfaceController &ctl, const std::string &iface,
                           const Settings &settings) {
    InterfaceStatus st = ctl.status(iface);
    if (!requireLink(st)) return EXIT_IFACE;

    GatewayClient client = makeClient(st, settings);
    std::cout << "[gateway] GET http://" << *st.gatewayAddress << ":" << settings.gatewayHttpPort << o.url
              << " via " << iface << "\n";
    HttpResponse r = client.request("GET", o.url);

    std::ofstream f(o.output, std::ios::binary | std::ios::trunc);
    if (!f) throw ConfigError("cannot write " + o.output);
    f.write(r.body.data(), (std::streamsize)r.body.size());
    if (!f) throw ConfigError("write failed: " + o.output);
    std::cout << "[gateway] HTTP " << r.status << ", " << r.body.size() << " bytes written to " << o.output << "\n";
    return (r.status >= 200 && r.status < 300) ? EXIT_OK : EXIT_GATEWAY;
}

static int cmdServe(const CliOptions &o, InterfaceController &ctl, const std::string &iface, const Settings &settings) {
    InterfaceStatus st;
    if (o.ssid) {
        st = ctl.connect(*o.ssid, o.password, iface, o.save);
    } else {
        st = ctl.status(iface);
    }
    if (!requireLink(st)) return EXIT_IFACE;
    std::cout << "[iface] " << iface << " on " << st.ssid.value_or("?") << " address " << st.localAddress.value_or("-")
              << " gateway " << *st.gatewayAddress << "\n";

    GatewayClient client = makeClient(st, settings);

    RelayOptions ropts;
    ropts.bufferFrames = settings.relayBufferFrames;
    ropts.maxReconnects = settings.relayMaxReconnects;
    StreamRelay relay([&client, &settings]() -> std::unique_ptr<FrameSource> {
        return std::make_unique<MjpegFrameSource>(client, settings.streamPath, settings.streamPort);
    }, ropts);

    GatewayCommandSink sink(client, settings.controlPath);
    TranslatorOptions topts;
    topts.heartbeatMs = settings.heartbeatMs;
    topts.minIntervalMs = settings.minIntervalMs;
    ControlTranslator translator(sink, topts);

    ProxyConfig pcfg;
    pcfg.bindHost = settings.bindHost;
    pcfg.port = o.port;
    pcfg.webRoot = settings.webRoot;
    pcfg.deviceControlPath = settings.controlPath;
    pcfg.sessionIdleMs = settings.sessionIdleMs;

    auto statusProvider = [&ctl, &sink, &client, iface]() {
        InterfaceStatus s = ctl.status(iface);
        json j;
        j["interface"] = {
            {"name", s.name},
            {"state", toString(s.state)},
            {"ssid", s.ssid ? json(*s.ssid) : json(nullptr)},
            {"localAddress", s.localAddress ? json(*s.localAddress) : json(nullptr)},
            {"gateway", s.gatewayAddress ? json(*s.gatewayAddress) : json(nullptr)}
        };
        j["device"] = {
            {"host", client.endpoint().host},
            {"httpPort", client.endpoint().httpPort},
            {"commandsDelivered", sink.delivered()},
            {"commandsFailed", sink.failed()}
        };
        return j;
    };
    ProxyGateway gateway(pcfg, client, relay, translator, statusProvider);
    sink.setHealthCallback([&gateway](bool ok, const std::string &detail) { gateway.setControlHealth(ok, detail); });

    sink.start();
    translator.start();

    std::signal(SIGINT, [](int){ shuttingDown.store(true); });
    std::signal(SIGTERM, [](int){ shuttingDown.store(true); });
    std::atomic<bool> served{false};
    std::thread watcher([&gateway, &served]() {
        while (!served.load()) {
            if (shuttingDown.load()) {
                std::cout << "[main] Shutting down\n";
                gateway.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    bool listened = gateway.run();
    served.store(true);
    watcher.join();

    translator.stop();
    sink.stop();
    relay.shutdown();
    std::cout << "[main] Stopped. Interface " << iface << " stays associated; use 'disconnect' to release it\n";
    return listened ? EXIT_OK : EXIT_CONFIG;
}

static int runCommand(const CliOptions &o) {
    const std::string &c = o.command;
    static const std::vector<std::string> known = {
        "list-interfaces", "scan", "connect", "status", "disconnect", "serve", "save-network", "show-config",
        "fetch-gateway"
    };
    if (std::find(known.begin(), known.end(), c) == known.end()) throw UsageError("unknown command '" + c + "'");

    Settings settings = Settings::fromEnv();
    CredentialStore store(CredentialStore::defaultPath());
    store.load();

    if (c == "show-config") return cmdShowConfig(store);
    if (c == "save-network") return cmdSaveNetwork(o, store);

    NmcliBackend backend;
    InterfaceController ctl(backend, &store);
    if (c == "list-interfaces") return cmdListInterfaces(ctl, store);

    const std::string iface = ctl.resolveInterface(o.iface);
    // Each invocation is a fresh process; start from what the host reports
    ctl.refresh(iface);

    if (c == "scan") return cmdScan(ctl, iface);
    if (c == "status") {
        printStatus(ctl.status(iface));
        return EXIT_OK;
    }
    if (c == "connect") {
        requireArgs(o, 1, "an SSID");
        printStatus(ctl.connect(o.args[0], o.password, iface, o.save));
        return EXIT_OK;
    }
    if (c == "disconnect") {
        ctl.disconnect(iface);
        return EXIT_OK;
    }
    if (c == "fetch-gateway") return cmdFetchGateway(o, ctl, iface, settings);
    return cmdServe(o, ctl, iface, settings);
}

// ----------------- main -----------------
int main(int argc, char **argv) {
    std::signal(SIGPIPE, SIG_IGN);
    try {
        CliOptions o = parseCli(argc, (const char **)argv);
        return runCommand(o);
    } catch (const UsageError &e) {
        std::cerr << "[main] Usage error: " << e.what() << "\n" << kCommands;
        return EXIT_USAGE;
    } catch (const InterfaceError &e) {
        std::cerr << "[iface] " << toString(e.code()) << ": " << e.what() << "\n";
        return EXIT_IFACE;
    } catch (const ConfigError &e) {
        std::cerr << "[main] Configuration error: " << e.what() << "\n";
        return EXIT_CONFIG;
    } catch (const GatewayUnreachable &e) {
        std::cerr << "[gateway] Unreachable: " << e.what() << "\n";
        return EXIT_GATEWAY;
    } catch (const std::exception &e) {
        std::cerr << "[main] " << e.what() << "\n";
        return EXIT_IFACE;
    }
}
