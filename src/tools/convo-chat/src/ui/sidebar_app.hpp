#pragma once

#include "convo/options.hpp"
#include "convo/sidebar/sidebar_controller.hpp"
#include "convo/store/entity_store.hpp"
#include "convo/store/folder_repository.hpp"
#include "convo/store/key_value_store.hpp"
#include "convo/store/page_fetcher.hpp"

#include "../tvision_include.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class SidebarWindow;

struct LaunchOptions
{
    std::filesystem::path conversationsFile;
    std::filesystem::path storeFile;
    std::optional<std::string> projectId;
};

class SidebarApp : public TApplication
{
public:
    SidebarApp(int argc, char **argv, const LaunchOptions &launch);
    ~SidebarApp();

    virtual void handleEvent(TEvent &event) override;
    virtual void idle() override;

    TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

    convo::sidebar::SidebarController &controller() noexcept { return *controller_; }

private:
    void openSidebarWindow();
    void rebuildMenuBar();
    void requestPage(convo::sidebar::IncrementalLoader::Completion done);
    void onPageFetched(convo::store::PageFetcher::Result result,
                       const convo::sidebar::IncrementalLoader::Completion &done);
    void applySourcePins();
    void showAboutDialog();

    std::optional<std::string> selectedConversationId() const;
    std::optional<std::string> selectedFolderId() const;
    std::optional<std::string> chooseFolder(const std::string &title);

    void newConversation();
    void togglePinSelected();
    void moveSelectedToFolder();
    void archiveSelected();
    void restoreArchived();
    void renameSelected();
    void deleteSelected();
    void newFolder();
    void renameFolder();
    void deleteFolder();
    void setAllFoldersExpanded(bool expanded);
    void search();
    void toggleShowLastMessage();
    void selectProject(std::optional<std::size_t> index);

    void persistBoolOption(const std::string &key, bool value);
    void reportStatus(const std::string &message);
    void reportError(const std::string &error);

    std::shared_ptr<convo::config::OptionRegistry> optionRegistry_;
    std::unique_ptr<convo::store::KeyValueStore> keyValueStore_;
    std::unique_ptr<convo::store::FolderRepository> folderRepository_;
    std::unique_ptr<convo::store::EntityStore> store_;
    std::unique_ptr<convo::sidebar::SidebarController> controller_;
    std::unique_ptr<convo::store::PageFetcher> fetcher_;

    SidebarWindow *window_ = nullptr;
    std::filesystem::path binaryDir_;
    std::size_t pageSize_ = 20;
    std::size_t nextPage_ = 0;
    std::size_t localCounter_ = 0;
    bool initialLoadStarted_ = false;
    bool showLastMessage_ = true;
    convo::store::IdSet appliedSourcePins_;
    std::vector<convo::store::Project> menuProjects_;
};
