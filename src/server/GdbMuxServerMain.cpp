#include <cxxopts.hpp>

#include "GdbMuxServer.hpp"
#include "Libssh2Client.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "ServerConfig.hpp"
#include "TcpSocketHandler.hpp"

using namespace gm;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  gm::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, gm::InterruptSignalHandler);

  cxxopts::Options options("gdbmux-server",
                           "Shares gdb sessions and remote shells with many "
                           "clients");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on", cxxopts::value<int>())          //
        ("bindip", "IP to listen on", cxxopts::value<string>())       //
        ("pipe", "Listen on this unix socket instead of tcp",         //
         cxxopts::value<string>())                                    //
        ("cfgfile", "Location of the config file",                    //
         cxxopts::value<std::string>()->default_value(""))            //
        ("gdbpath", "gdb binary to launch", cxxopts::value<string>())  //
        ("gdbcommand", "Full gdb command line, overrides --gdbpath",  //
         cxxopts::value<string>())                                    //
        ("token", "Token clients must present, generated if unset",   //
         cxxopts::value<string>())                                    //
        ("logdir", "Directory for log files", cxxopts::value<string>())  //
        ("logtostdout", "log to stdout")                                 //
        ("nossh", "Disable remote shell support")                        //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "gdbmux version " << GM_VERSION << endl;
      exit(0);
    }

    ServerConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      try {
        config.loadIni(cfgfilename);
      } catch (const std::runtime_error &ex) {
        STFATAL << ex.what();
      }
    }

    // Command line wins over the config file
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("pipe")) {
      config.pipePath = result["pipe"].as<string>();
    }
    if (result.count("gdbpath")) {
      config.gdbPath = result["gdbpath"].as<string>();
    }
    if (result.count("gdbcommand")) {
      config.gdbCommand = result["gdbcommand"].as<string>();
    }
    if (result.count("token")) {
      config.token = result["token"].as<string>();
    }
    if (result.count("logdir")) {
      config.logDir = result["logdir"].as<string>();
    }
    if (result.count("nossh")) {
      config.sshEnabled = false;
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    LogHandler::setupLogFiles(&defaultConf, config.logDir, "gdbmux-server",
                              result.count("logtostdout") > 0,
                              !result.count("logtostdout"), config.logSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("gdbmux-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (config.token.empty()) {
      config.token = genRandomAlphaNum(32);
      CLOG(INFO, "stdout") << "Generated client token: " << config.token
                           << endl;
    }

    shared_ptr<SocketHandler> serverSocketHandler;
    SocketEndpoint serverEndpoint;
    if (!config.pipePath.empty()) {
      serverSocketHandler.reset(new PipeSocketHandler());
      serverEndpoint.set_name(config.pipePath);
    } else {
      if (config.port <= 0 || config.port > 65535) {
        STFATAL << "Invalid port: " << config.port;
      }
      serverSocketHandler.reset(new TcpSocketHandler());
      serverEndpoint.set_port(config.port);
      if (config.bindIp.length()) {
        serverEndpoint.set_name(config.bindIp);
      }
    }

    auto registry =
        make_shared<ClientConnectionRegistry>(serverSocketHandler);
    shared_ptr<RemoteClientFactory> remoteFactory;
    if (config.sshEnabled) {
      remoteFactory.reset(new Libssh2ClientFactory());
    }
    auto remote = make_shared<RemoteSessionController>(
        registry, remoteFactory, config.sshEnabled, config.sshTimeout);
    auto manager = make_shared<SessionManager>(
        shared_ptr<DebugSessionFactory>(new GdbDebugSessionFactory()),
        config.orphanPolicy);
    auto relay = make_shared<OutputRelay>(manager, registry);
    shared_ptr<Authorizer> authorizer(
        new TokenAuthorizer(config.token, config.allowPaths));
    auto gateway = make_shared<EventGateway>(manager, remote, relay, authorizer,
                                             registry,
                                             config.effectiveGdbCommand());

    CLOG(INFO, "stdout") << "gdbmux listening on " << serverEndpoint << endl;
    {
      GdbMuxServer server(serverSocketHandler, serverEndpoint, registry,
                          gateway);
      server.run();
    }
    relay->stop();
    remote->shutdown();
    manager->removeAll();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
}
