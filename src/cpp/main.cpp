#include "app_context.hpp"
#include "config_loader.hpp"
#include "debug.hpp"
#include "event_bridge.hpp"
#include "gtk_menu_binding.hpp"
#include "main_window.hpp"
#include "menu_registry.hpp"
#include "message_router.hpp"
#include "worker_pool.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static const char* APPLICATION_ID = "io.pandia.editor";

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [FILES...] [OPTIONS]\n"
              << "\n"
              << "Positional arguments:\n"
              << "  FILES   .json, .json5 or .jsonc documents to open\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>   Use custom YAML config file\n"
              << "  --debug           Print debug logging to stderr\n"
              << "  --help, -h        Show this help message\n"
              << "\n"
              << "Config file search order:\n"
              << "  1. ~/.config/pandia/config.yaml\n"
              << "  2. ./config.yaml (current directory)\n"
              << "\n"
              << "Without a config file the built-in defaults are used.\n";
}

class PandiaApplication : public Gtk::Application {
public:
    PandiaApplication(const AppConfig& config, EventBridge& bridge,
                      MenuRegistry& registry, MessageRouter& router)
        : Gtk::Application(APPLICATION_ID, Gio::Application::Flags::HANDLES_OPEN)
        , config_(config)
        , bridge_(bridge)
        , registry_(registry)
        , router_(router)
    {}

    bool startup_failed() const { return startup_failed_; }

protected:
    void on_startup() override {
        Gtk::Application::on_startup();

        try {
            registry_.build(MenuRegistry::default_definition());
            binding_ = std::make_unique<GtkMenuBinding>(*this, registry_);
            binding_->set_native_handler([this](const std::string& id) { on_native_item(id); });
            binding_->install();
        } catch (const MenuBuildError& e) {
            ERROR_LOG("Could not build the application menu: " << e.what());
            startup_failed_ = true;
            quit();
        }
    }

    void on_activate() override {
        if (startup_failed_) {
            return;
        }
        ensure_window();
        window_->present();
    }

    void on_open(const type_vec_files& files, const Glib::ustring&) override {
        if (startup_failed_) {
            return;
        }

        std::vector<std::string> uris;
        for (const auto& file : files) {
            uris.push_back(file->get_uri());
        }
        size_t accepted = bridge_.on_opened(uris);
        DEBUG_LOGLN << "Open request: " << uris.size() << " file(s), " << accepted << " accepted";

        ensure_window();
        window_->present();
    }

    void on_shutdown() override {
        binding_.reset();
        window_.reset();
        Gtk::Application::on_shutdown();
    }

private:
    void ensure_window() {
        if (window_) {
            return;
        }
        window_ = std::make_unique<MainWindow>(config_, bridge_, router_);
        add_window(*window_);
        if (config_.devtools) {
            window_->show_devtools();
        }
    }

    void on_native_item(const std::string& id) {
        if (id == "quit") {
            quit();
            return;
        }
        if (window_) {
            window_->run_native_command(id);
        }
    }

    const AppConfig& config_;
    EventBridge& bridge_;
    MenuRegistry& registry_;
    MessageRouter& router_;

    std::unique_ptr<GtkMenuBinding> binding_;
    std::unique_ptr<MainWindow> window_;
    bool startup_failed_ = false;
};

int main(int argc, char** argv) {
    // Parse command line arguments
    std::string config_file;
    bool debug_flag = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file argument\n";
                return 1;
            }
            config_file = argv[++i];
        } else if (arg == "--debug") {
            debug_flag = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
    }

    // Load configuration
    std::string config_source = config_file.empty() ? AppConfig::find_config_file() : config_file;
    AppConfig config;
    if (!config_source.empty()) {
        config = AppConfig::from_yaml(config_source);
    }

    DebugLog::set_enabled(config.debug || debug_flag);
    if (config_source.empty()) {
        DEBUG_LOGLN << "No config file found, using defaults";
    } else {
        DEBUG_LOGLN << "Using config file: " << config_source;
    }

    if (!config.validate()) {
        std::cerr << "Invalid configuration\n";
        return 1;
    }

    AppContext context;
    EventBridge bridge(context);
    MenuRegistry registry(context);
    WorkerPool workers(static_cast<uint32_t>(config.worker_threads));
    MessageRouter router(bridge, registry, workers);

    // --config's value is not a file to open
    std::vector<std::string> args;
    for (int i = 0; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
            continue;
        }
        args.push_back(arg);
    }
    bridge.seed_from_args(args);

    PandiaApplication app(config, bridge, registry, router);

    try {
        app.register_application();
    } catch (const Glib::Error& e) {
        ERROR_LOG("Could not register application: " << e.what());
        return 1;
    }

    if (app.is_remote()) {
        // Hand our files to the running instance
        std::vector<std::string> paths = bridge.drain_pending();
        DEBUG_LOGLN << "Forwarding " << paths.size() << " file(s) to the running instance";
        if (paths.empty()) {
            app.activate();
        } else {
            Gio::Application::type_vec_files files;
            for (const auto& path : paths) {
                files.push_back(Gio::File::create_for_path(path));
            }
            app.open(files);
        }

        // Without run() nothing flushes the queued D-Bus call before exit
        auto connection = app.get_dbus_connection();
        if (connection) {
            try {
                connection->flush_sync();
            } catch (const Glib::Error& e) {
                ERROR_LOG("Could not reach the running instance: " << e.what());
                return 1;
            }
        }
        return 0;
    }

    // Our flags are already handled; GApplication only sees the program name
    int status = app.run(1, argv);
    if (app.startup_failed()) {
        return 1;
    }
    return status;
}
