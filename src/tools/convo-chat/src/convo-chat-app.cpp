#include "convo/app_info.hpp"
#include "convo/sidebar/list_composer.hpp"
#include "convo/store/conversation_source.hpp"
#include "convo/store/entity_store.hpp"
#include "convo/store/folder_repository.hpp"
#include "convo/store/key_value_store.hpp"

#include "ui/sidebar_app.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <csignal>
#include <execinfo.h>
#include <unistd.h>

namespace
{
    const convo::appinfo::ToolInfo &tool_info()
    {
        return convo::appinfo::requireTool("convo-chat");
    }

    void crash_handler(int sig, siginfo_t *, void *)
    {
        void *frames[64];
        int count = backtrace(frames, 64);
        backtrace_symbols_fd(frames, count, STDERR_FILENO);
        _exit(128 + sig);
    }

    void install_crash_handlers()
    {
        struct sigaction action {};
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_SIGINFO | SA_RESETHAND;
        action.sa_sigaction = crash_handler;
        sigaction(SIGSEGV, &action, nullptr);
        sigaction(SIGABRT, &action, nullptr);
    }

    bool is_help_flag(std::string_view arg)
    {
        return arg == "--help" || arg == "-h";
    }

    struct CliOptions
    {
        bool showHelp = false;
        bool list = false;
        std::optional<std::string> error;
        LaunchOptions launch;
    };

    // Accepts "--name VALUE" and "--name=VALUE".
    bool take_value(int argc, char **argv, int &i, std::string_view name, std::string &out)
    {
        std::string_view arg(argv[i]);
        if (arg == name)
        {
            if (i + 1 >= argc)
                return false;
            out = argv[++i];
            return true;
        }
        if (arg.size() > name.size() && arg.substr(0, name.size()) == name && arg[name.size()] == '=')
        {
            out = std::string(arg.substr(name.size() + 1));
            return true;
        }
        return false;
    }

    CliOptions parse_cli(int argc, char **argv)
    {
        CliOptions options;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view arg(argv[i]);
            std::string value;
            if (is_help_flag(arg))
                options.showHelp = true;
            else if (arg == "--list")
                options.list = true;
            else if (take_value(argc, argv, i, "--conversations", value))
                options.launch.conversationsFile = value;
            else if (take_value(argc, argv, i, "--store", value))
                options.launch.storeFile = value;
            else if (take_value(argc, argv, i, "--project", value))
                options.launch.projectId = value;
            else
                options.error = "Unknown or incomplete argument: " + std::string(arg);
        }
        return options;
    }

    void print_banner()
    {
        const auto &info = tool_info();
        std::cout << "=== " << info.displayName << " ===\n";
        std::cout << info.shortDescription << "\n\n";
    }

    void print_usage()
    {
        std::cout << "Usage: " << tool_info().executable
                  << " [--conversations FILE] [--store FILE] [--project ID] [--list]\n";
        std::cout << "  --conversations FILE  read conversations from a JSON file instead of sample data\n";
        std::cout << "  --store FILE          keep folders in FILE instead of the config directory\n";
        std::cout << "  --project ID          start with the sidebar filtered to one project\n";
        std::cout << "  --list                print the composed sidebar and exit\n";
    }

    std::string describe(const convo::sidebar::ComposedListItem &item)
    {
        using namespace convo::sidebar;
        if (const auto *section = std::get_if<SectionItem>(&item))
            return "[" + section->title + "]";
        if (const auto *folder = std::get_if<FolderHeaderItem>(&item))
            return std::string(folder->expanded ? "v " : "> ") + folder->name + " (" +
                   std::to_string(folder->count) + ")";
        const auto &row = std::get<ConversationRowItem>(item);
        std::string text = std::string(row.inFolder ? "    " : "  ") + row.conversation.title;
        text += "  " + convo::store::formatTimestamp(row.conversation.timestamp);
        return text;
    }

    // Pages through the whole source synchronously and prints the sidebar
    // with every folder expanded.
    int run_list(const LaunchOptions &launch)
    {
        std::shared_ptr<convo::store::ConversationSource> source;
        if (launch.conversationsFile.empty())
            source = std::make_shared<convo::store::SampleConversationSource>();
        else
            source = std::make_shared<convo::store::JsonConversationSource>(launch.conversationsFile);

        convo::store::KeyValueStore keyValueStore(launch.storeFile.empty()
                                                      ? convo::store::KeyValueStore::defaultPath("convo-chat")
                                                      : launch.storeFile);
        convo::store::FolderRepository repository(keyValueStore);
        convo::store::EntityStore store(&repository);

        constexpr std::size_t pageSize = 50;
        for (std::size_t page = 0;; ++page)
        {
            auto result = source->fetchPage(page, pageSize);
            store.appendConversations(result.conversations);
            if (result.conversations.size() < pageSize)
                break;
        }
        store.setProjects(source->projects());
        for (const auto &id : source->initiallyPinned())
            store.setPinned(id, true);

        convo::sidebar::ExpandedFolderSet expanded;
        for (const auto &folder : store.folders())
            expanded.insert(folder.id);

        const auto items = convo::sidebar::compose(store.snapshot(), expanded, launch.projectId);
        for (const auto &item : items)
            std::cout << describe(item) << '\n';
        if (items.empty())
            std::cout << "No conversations.\n";
        return 0;
    }

} // namespace

int main(int argc, char **argv)
{
    install_crash_handlers();

    CliOptions options = parse_cli(argc, argv);
    if (options.error)
    {
        std::cerr << *options.error << '\n';
        print_usage();
        return 2;
    }
    if (options.showHelp)
    {
        print_banner();
        print_usage();
        return 0;
    }
    if (options.list)
    {
        try
        {
            return run_list(options.launch);
        }
        catch (const std::exception &ex)
        {
            std::cerr << tool_info().executable << ": " << ex.what() << '\n';
            return 1;
        }
    }

    SidebarApp app(argc, argv, options.launch);
    app.run();
    app.shutDown();
    return 0;
}
