#include "Capabilities.hpp"
#include "LogHandler.hpp"
#include "PaneConfig.hpp"
#include "PanePainter.hpp"
#include "PaneRegistry.hpp"
#include "PlainTextEmulator.hpp"
#include "UnixPty.hpp"
#include "UnixTerminalDevice.hpp"
#include "Utf8.hpp"

using namespace lpane;

namespace {
const DomainId LOCAL_DOMAIN = 0;

void pumpOutput(shared_ptr<PaneSession> pane, unique_ptr<PtyReader> reader) {
  el::Helpers::setThreadName("pane-reader");
  char buf[16 * 1024];
  try {
    while (true) {
      size_t bytesRead = reader->read(buf, sizeof(buf));
      if (bytesRead == 0) {
        VLOG(1) << "Pane " << pane->paneId() << " output closed";
        break;
      }
      pane->feed(string(buf, bytesRead));
    }
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Stopped reading pane " << pane->paneId() << ": "
               << ex.what();
  }
}

void handleInput(PaneSession* pane, const InputEvent& event) {
  try {
    switch (event.type) {
      case InputEventType::KEY:
        pane->dispatchKey(event.key.key, event.key.modifiers);
        break;
      case InputEventType::MOUSE:
        if (pane->isMouseGrabbed()) {
          pane->dispatchMouse(event.mouse);
        }
        break;
      case InputEventType::PASTE:
        pane->paste(event.paste);
        break;
      case InputEventType::RESIZED:
        pane->resize(event.size);
        break;
    }
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Pane " << pane->paneId() << " rejected input: "
                 << re.what();
  }
}

void runInteractive(PaneSession* pane) {
  auto device =
      UnixTerminalDevice::openControllingTerminal(Capabilities::fromEnvironment());
  device->setRawMode();
  pane->resize(device->getScreenSize());
  pane->focusChanged(true);

  PanePainter painter;
  string lastTitle;
  while (!pane->isTerminated()) {
    while (true) {
      auto event = device->pollInput(Blocking::DoNotWait);
      if (!event) {
        break;
      }
      handleInput(pane, *event);
    }
    {
      auto view = pane->renderableView();
      if (painter.needsPaint(*view)) {
        device->render(painter.paint(*view));
      }
    }
    string title = pane->title();
    if (title != lastTitle) {
      device->render({Change::setTitle(title)});
      lastTitle = title;
    }
    device->flush();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  device->render({Change::clear()});
  device->flush();
}

void waitForExit(PaneSession* pane, int timeoutMs) {
  auto start = std::chrono::steady_clock::now();
  bool terminated = false;
  while (!pane->isTerminated()) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();
    if (!terminated && timeoutMs > 0 && elapsed > timeoutMs) {
      LOG(INFO) << "Pane " << pane->paneId() << " timed out, terminating";
      CLOG(INFO, "stdout") << "Timed out after " << timeoutMs << " ms" << endl;
      pane->terminate();
      terminated = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void report(PaneSession* pane, const PaneConfig& config) {
  {
    auto view = pane->renderableView();
    const Screen& screen = view->screen();
    for (size_t row = 0; row < screen.numLines(); row++) {
      string text = screen.line(row).asString();
      if (!text.empty()) {
        CLOG(INFO, "stdout") << text << endl;
      }
    }
  }
  string title = pane->title();
  if (!title.empty()) {
    CLOG(INFO, "stdout") << "title: " << title << endl;
  }
  auto cwd = pane->currentWorkingDirectory();
  if (cwd) {
    CLOG(INFO, "stdout") << "cwd: " << *cwd << endl;
  }
  switch (pane->exitState()) {
    case ExitState::Running:
      CLOG(INFO, "stdout") << "state: running" << endl;
      break;
    case ExitState::Exited:
      CLOG(INFO, "stdout") << "state: exited" << endl;
      break;
    case ExitState::Unknown:
      CLOG(INFO, "stdout") << "state: unknown" << endl;
      break;
  }

  if (!config.search.empty()) {
    Pattern pattern = config.searchIsRegex
                          ? Pattern::regex(config.search)
                          : config.ignoreCase
                                ? Pattern::caseInsensitive(config.search)
                                : Pattern::caseSensitive(config.search);
    auto pending = pane->searchAsync(pattern);
    auto results = pending.get();
    CLOG(INFO, "stdout") << results.size() << " match(es) for "
                         << config.search << endl;
    for (auto& result : results) {
      CLOG(INFO, "stdout") << "  " << result << endl;
    }
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  lpane::HandleTerminate();

  // Cell widths and case folding come from LC_CTYPE
  utf8::setupLocale();

  // Override easylogging handler for sigint
  ::signal(SIGINT, lpane::InterruptSignalHandler);

  cxxopts::Options options = PaneConfig::createOptions();
  int exitCode = 0;
  try {
    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "lpane version " << LPANE_VERSION << endl;
      exit(0);
    }

    PaneConfig config;
    if (!result["cfgfile"].as<string>().empty()) {
      config.loadIniFile(result["cfgfile"].as<string>());
    }
    config.applyCommandLine(result);

    string logPath = LogHandler::setupLogFiles(&defaultConf,
                                               config.logSettings());
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("lpane-main");
    VLOG(1) << "Logging to " << logPath;

    ScreenSize size(config.rows, config.cols);
    UnixPtySpawner spawner;
    SpawnedPty spawned = spawner.spawn(config.commandLine(), size);
    shared_ptr<PtyWriter> childInput = spawned.master->tryCloneWriter();
    unique_ptr<TerminalEmulator> emulator(
        new PlainTextEmulator(size, config.scrollback, childInput));

    PaneRegistry registry;
    shared_ptr<PaneSession> pane(
        new PaneSession(allocPaneId(), LOCAL_DOMAIN, std::move(emulator),
                        std::move(spawned.child), std::move(spawned.master)));
    pane->setClipboard(make_shared<MemoryClipboard>());
    registry.addPane(pane);
    LOG(INFO) << "Started pane " << pane->paneId();

    std::thread pump(pumpOutput, pane, pane->reader());
    try {
      if (config.interactive) {
        runInteractive(pane.get());
      } else {
        waitForExit(pane.get(), config.timeoutMs);
      }
    } catch (const std::exception& ex) {
      // The pump only stops once the child is gone
      LOG(ERROR) << "Giving up on pane " << pane->paneId() << ": "
                 << ex.what();
      pane->terminate();
      pump.join();
      throw;
    }
    pump.join();

    report(pane.get(), config);
    VLOG(1) << "Final state: " << registry.toJsonString();
    auto status = pane->exitStatus();
    exitCode = status ? status->code : 1;

    registry.removePane(pane->paneId());
  } catch (cxxopts::exceptions::exception& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exitCode = 1;
  } catch (const std::exception& ex) {
    LOG(ERROR) << "lpane failed: " << ex.what();
    CLOG(INFO, "stdout") << "Error: " << ex.what() << endl;
    exitCode = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return exitCode;
}
