#include "sidebar_app.hpp"
#include "../commands.hpp"
#include "pick_list_dialog.hpp"
#include "sidebar_options.hpp"
#include "sidebar_window.hpp"

#include "convo/app_info.hpp"
#include "convo/log.hpp"
#include "convo/store/conversation_source.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <variant>

namespace
{
  const convo::appinfo::ToolInfo &tool_info()
  {
    return convo::appinfo::requireTool("convo-chat");
  }

  constexpr std::size_t kInputLimit = 120;

  std::shared_ptr<convo::store::ConversationSource>
  make_source(const std::filesystem::path &file)
  {
    if (file.empty())
      return std::make_shared<convo::store::SampleConversationSource>();
    return std::make_shared<convo::store::JsonConversationSource>(file);
  }

  bool prompt_text(const char *title, const char *label, std::string &value)
  {
    char buffer[kInputLimit + 1] = {};
    std::strncpy(buffer, value.c_str(), kInputLimit);
    if (inputBox(title, label, buffer, static_cast<uchar>(kInputLimit)) != cmOK)
      return false;
    value = buffer;
    return true;
  }
} // namespace

SidebarApp::SidebarApp(int argc, char **argv, const LaunchOptions &launch)
    : TProgInit(&SidebarApp::initStatusLine, nullptr, &TApplication::initDeskTop)
{
  if (argv && argc > 0 && argv[0])
  {
    std::error_code ec;
    binaryDir_ = std::filesystem::absolute(std::filesystem::path(argv[0]), ec).parent_path();
    if (ec)
      binaryDir_.clear();
  }
  if (binaryDir_.empty())
    binaryDir_ = std::filesystem::current_path();

  optionRegistry_ = std::make_shared<convo::config::OptionRegistry>("convo-chat");
  convo::chat::registerSidebarOptions(*optionRegistry_);
  optionRegistry_->loadDefaults();

  const std::string logFile = optionRegistry_->getString(convo::chat::kOptionLogFile);
  convo::log::setLogFile(logFile.empty() ? binaryDir_ / "convo-chat.log" : std::filesystem::path(logFile));
  convo::log::info("Starting " + std::string(tool_info().executable));

  pageSize_ = static_cast<std::size_t>(optionRegistry_->getInteger(convo::chat::kOptionPageSize, 20));
  showLastMessage_ = optionRegistry_->getBool(convo::chat::kOptionShowLastMessage, true);

  std::filesystem::path storePath = launch.storeFile;
  if (storePath.empty())
    storePath = convo::store::KeyValueStore::defaultPath("convo-chat");
  keyValueStore_ = std::make_unique<convo::store::KeyValueStore>(storePath);
  folderRepository_ = std::make_unique<convo::store::FolderRepository>(*keyValueStore_);
  store_ = std::make_unique<convo::store::EntityStore>(folderRepository_.get());
  convo::log::info("Folder store: " + storePath.string() + " (" +
                   std::to_string(store_->folders().size()) + " folders)");

  std::filesystem::path sourcePath = launch.conversationsFile;
  if (sourcePath.empty())
    sourcePath = optionRegistry_->getString(convo::chat::kOptionConversationsFile);
  fetcher_ = std::make_unique<convo::store::PageFetcher>(make_source(sourcePath));
  convo::log::info("Conversation source: " + fetcher_->source()->description());

  controller_ = std::make_unique<convo::sidebar::SidebarController>(
      *store_, convo::chat::sidebarSettings(*optionRegistry_));
  controller_->setStatusCallback([this](const std::string &message) { reportStatus(message); });
  controller_->setErrorCallback([this](const std::string &error) { reportError(error); });
  controller_->setChangeCallback([this]() {
    if (window_)
      window_->sidebarChanged();
  });
  controller_->setSelectCallback([this](const convo::store::Conversation &conversation) {
    convo::log::debug("Opened conversation " + conversation.id);
    if (window_)
      window_->showConversation(conversation);
  });
  controller_->setLoadMore([this](convo::sidebar::IncrementalLoader::Completion done) {
    requestPage(std::move(done));
  });
  if (launch.projectId)
    controller_->setActiveProject(launch.projectId);

  rebuildMenuBar();
  openSidebarWindow();
}

SidebarApp::~SidebarApp()
{
  // Join the worker before the store it would have fed goes away.
  fetcher_.reset();
  convo::log::info("Shutting down");
}

void SidebarApp::openSidebarWindow()
{
  if (!deskTop)
    return;

  TRect bounds = deskTop->getExtent();
  auto *window = new SidebarWindow(bounds, *controller_);
  window_ = window;
  deskTop->insert(window);
  window->setShowLastMessage(showLastMessage_);
  controller_->refresh();
  window->sidebarChanged();
  window->focusList();
}

void SidebarApp::idle()
{
  TApplication::idle();

  if (!initialLoadStarted_ && deskTop)
  {
    initialLoadStarted_ = true;
    controller_->loadMore();
  }

  if (fetcher_)
    fetcher_->poll();
}

void SidebarApp::requestPage(convo::sidebar::IncrementalLoader::Completion done)
{
  const std::size_t page = nextPage_;
  convo::log::debug("Requesting page " + std::to_string(page));
  const bool started = fetcher_->start(page, pageSize_, [this, done](convo::store::PageFetcher::Result result) {
    onPageFetched(std::move(result), done);
  });
  if (!started)
    done(convo::sidebar::IncrementalLoader::LoadResult::failure("A page request is already running"));
}

void SidebarApp::onPageFetched(convo::store::PageFetcher::Result result,
                               const convo::sidebar::IncrementalLoader::Completion &done)
{
  if (!result.ok)
  {
    convo::log::error("Page " + std::to_string(nextPage_) + " failed: " + result.error);
    done(convo::sidebar::IncrementalLoader::LoadResult::failure(result.error));
    return;
  }

  const auto &conversations = result.page.conversations;
  const std::size_t added = store_->appendConversations(conversations);
  if (nextPage_ == 0)
  {
    store_->setProjects(fetcher_->source()->projects());
    rebuildMenuBar();
  }
  applySourcePins();
  ++nextPage_;

  if (conversations.size() < pageSize_)
    controller_->setHasMore(false);
  convo::log::info("Loaded page " + std::to_string(result.page.pageIndex) + ": " +
                   std::to_string(added) + " new conversations");

  done(convo::sidebar::IncrementalLoader::LoadResult::success());
  controller_->refresh();
  if (window_)
    window_->sidebarChanged();
  reportStatus(std::to_string(store_->conversations().size()) + " conversations" +
               (controller_->hasMore() ? "" : ", all loaded"));
}

void SidebarApp::applySourcePins()
{
  for (const auto &id : fetcher_->source()->initiallyPinned())
  {
    if (appliedSourcePins_.count(id) || !store_->findConversation(id))
      continue;
    store_->setPinned(id, true);
    appliedSourcePins_.insert(id);
  }
}

void SidebarApp::handleEvent(TEvent &event)
{
  TApplication::handleEvent(event);
  if (event.what != evCommand)
    return;

  const ushort command = event.message.command;
  switch (command)
  {
  case cmAbout:
    showAboutDialog();
    break;
  case cmNewConversation:
    newConversation();
    break;
  case cmOpenConversation:
    controller_->activateSelected();
    break;
  case cmTogglePin:
    togglePinSelected();
    break;
  case cmMoveToFolder:
    moveSelectedToFolder();
    break;
  case cmArchive:
    archiveSelected();
    break;
  case cmRestoreArchived:
    restoreArchived();
    break;
  case cmRenameConversation:
    renameSelected();
    break;
  case cmDeleteConversation:
    deleteSelected();
    break;
  case cmNewFolder:
    newFolder();
    break;
  case cmRenameFolder:
    renameFolder();
    break;
  case cmDeleteFolder:
    deleteFolder();
    break;
  case cmExpandAllFolders:
    setAllFoldersExpanded(true);
    break;
  case cmCollapseAllFolders:
    setAllFoldersExpanded(false);
    break;
  case cmLoadMore:
    if (!controller_->loadMore())
      reportStatus(controller_->hasMore() ? "Already loading" : "Everything is loaded");
    break;
  case cmSearch:
    search();
    break;
  case cmClearSearch:
    controller_->setSearchQuery(std::string());
    break;
  case cmShowLastMessage:
    toggleShowLastMessage();
    break;
  case cmProjectAll:
    selectProject(std::nullopt);
    break;
  default:
    if (command >= cmProjectBase && command < cmProjectBase + convo::commands::chat::ProjectLimit)
    {
      selectProject(static_cast<std::size_t>(command - cmProjectBase));
      break;
    }
    return;
  }
  clearEvent(event);
}

TMenuBar *SidebarApp::initMenuBar(TRect r)
{
  r.b.y = r.a.y + 1;

  TSubMenu &fileMenu = *new TSubMenu("~F~ile", hcNoContext) +
                       *new TMenuItem("~N~ew Conversation", cmNewConversation, kbCtrlN, hcNoContext, "Ctrl-N") +
                       *new TMenuItem("~L~oad More", cmLoadMore, kbNoKey, hcNoContext) +
                       newLine() +
                       *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext, "Alt-X");

  TSubMenu &conversationMenu =
      *new TSubMenu("~C~onversation", hcNoContext) +
      *new TMenuItem("~O~pen", cmOpenConversation, kbNoKey, hcNoContext, "Enter") +
      *new TMenuItem("~P~in / Unpin", cmTogglePin, kbNoKey, hcNoContext, "P") +
      *new TMenuItem("~M~ove to Folder...", cmMoveToFolder, kbNoKey, hcNoContext, "M") +
      *new TMenuItem("~R~ename...", cmRenameConversation, kbNoKey, hcNoContext, "F2") +
      *new TMenuItem("~A~rchive", cmArchive, kbNoKey, hcNoContext, "A") +
      *new TMenuItem("Restore Arc~h~ived...", cmRestoreArchived, kbNoKey, hcNoContext) +
      newLine() +
      *new TMenuItem("~D~elete", cmDeleteConversation, kbNoKey, hcNoContext, "Del");

  TSubMenu &folderMenu = *new TSubMenu("F~o~lders", hcNoContext) +
                         *new TMenuItem("~N~ew Folder...", cmNewFolder, kbNoKey, hcNoContext) +
                         *new TMenuItem("~R~ename Folder...", cmRenameFolder, kbNoKey, hcNoContext) +
                         *new TMenuItem("~D~elete Folder...", cmDeleteFolder, kbNoKey, hcNoContext) +
                         newLine() +
                         *new TMenuItem("~E~xpand All", cmExpandAllFolders, kbNoKey, hcNoContext) +
                         *new TMenuItem("~C~ollapse All", cmCollapseAllFolders, kbNoKey, hcNoContext);

  TSubMenu &viewMenu = *new TSubMenu("~V~iew", hcNoContext) +
                       *new TMenuItem("~S~earch...", cmSearch, kbNoKey, hcNoContext, "/") +
                       *new TMenuItem("~C~lear Search", cmClearSearch, kbNoKey, hcNoContext);
  std::string previewLabel = std::string(showLastMessage_ ? "[x] " : "[ ] ") + "Show Last Message";
  viewMenu + *new TMenuItem(previewLabel.c_str(), cmShowLastMessage, kbNoKey, hcNoContext);

  TSubMenu &projectMenu = *new TSubMenu("~P~rojects", hcNoContext);
  const auto &active = controller_ ? controller_->activeProject() : std::optional<std::string>();
  std::string allLabel = std::string(active ? "    " : "(*) ") + "All Conversations";
  projectMenu + *new TMenuItem(allLabel.c_str(), cmProjectAll, kbNoKey, hcNoContext);

  menuProjects_ = store_ ? store_->projects() : std::vector<convo::store::Project>();
  if (menuProjects_.size() > convo::commands::chat::ProjectLimit)
    menuProjects_.resize(convo::commands::chat::ProjectLimit);
  if (!menuProjects_.empty())
    projectMenu + newLine();
  for (std::size_t i = 0; i < menuProjects_.size(); ++i)
  {
    const auto &project = menuProjects_[i];
    std::string label = std::string(active == project.id ? "(*) " : "    ") + project.name;
    projectMenu + *new TMenuItem(label.c_str(), static_cast<ushort>(cmProjectBase + i), kbNoKey, hcNoContext);
  }

  TMenuItem &menuChain = fileMenu + conversationMenu + folderMenu + viewMenu + projectMenu +
                         *new TSubMenu("~H~elp", hcNoContext) +
                         *new TMenuItem("~A~bout", cmAbout, kbNoKey, hcNoContext);

  return new TMenuBar(r, static_cast<TSubMenu &>(menuChain));
}

TStatusLine *SidebarApp::initStatusLine(TRect r)
{
  r.a.y = r.b.y - 1;

  auto *newItem = new TStatusItem("~Ctrl-N~ New", kbCtrlN, cmNewConversation);
  auto *renameItem = new TStatusItem("~F2~ Rename", kbF2, cmRenameConversation);
  auto *searchItem = new TStatusItem("~/~ Search", kbNoKey, cmSearch);
  auto *quitItem = new TStatusItem("~Alt-X~ Quit", kbAltX, cmQuit);
  newItem->next = renameItem;
  renameItem->next = searchItem;
  searchItem->next = quitItem;

  return new TStatusLine(r, *new TStatusDef(0, 0xFFFF, newItem));
}

void SidebarApp::rebuildMenuBar()
{
  if (!deskTop)
    return;

  TRect bounds;
  if (TProgram::menuBar)
    bounds = TProgram::menuBar->getBounds();
  else
  {
    bounds = getExtent();
    bounds.b.y = bounds.a.y + 1;
  }

  if (TProgram::menuBar)
  {
    TMenuBar *oldBar = TProgram::menuBar;
    remove(oldBar);
    TObject::destroy(oldBar);
  }

  TMenuBar *newBar = initMenuBar(bounds);
  if (newBar)
  {
    insert(newBar);
    TProgram::menuBar = newBar;
    newBar->drawView();
  }
}

void SidebarApp::showAboutDialog()
{
  const auto &info = tool_info();
  std::string text = std::string(info.displayName) + "\n\n" + std::string(info.aboutDescription);
#ifdef CONVO_CHAT_VERSION
  text += "\n\nVersion: " CONVO_CHAT_VERSION;
#endif
  messageBox(text.c_str(), mfInformation | mfOKButton);
}

std::optional<std::string> SidebarApp::selectedConversationId() const
{
  const auto *item = controller_->selectedItem();
  if (!item)
    return std::nullopt;
  if (const auto *row = std::get_if<convo::sidebar::ConversationRowItem>(item))
    return row->conversation.id;
  return std::nullopt;
}

std::optional<std::string> SidebarApp::selectedFolderId() const
{
  const auto *item = controller_->selectedItem();
  if (!item)
    return std::nullopt;
  if (const auto *header = std::get_if<convo::sidebar::FolderHeaderItem>(item))
    return header->id;
  return std::nullopt;
}

std::optional<std::string> SidebarApp::chooseFolder(const std::string &title)
{
  const auto &folders = store_->folders();
  if (folders.empty())
  {
    messageBox("There are no folders yet.", mfInformation | mfOKButton);
    return std::nullopt;
  }
  std::vector<std::string> labels;
  labels.reserve(folders.size());
  for (const auto &folder : folders)
    labels.push_back(folder.name);
  auto choice = pickFromList(title, "Folder:", labels);
  if (!choice)
    return std::nullopt;
  return folders[*choice].id;
}

void SidebarApp::newConversation()
{
  convo::store::Conversation conversation;
  conversation.id = "local-" + std::to_string(++localCounter_);
  while (store_->findConversation(conversation.id))
    conversation.id = "local-" + std::to_string(++localCounter_);
  conversation.title = "New conversation";
  conversation.timestamp = std::chrono::system_clock::now();
  if (!store_->prependConversation(conversation))
    return;
  controller_->refresh();
  controller_->selectConversation(conversation.id);
  convo::log::info("Created conversation " + conversation.id);
}

void SidebarApp::togglePinSelected()
{
  if (auto id = selectedConversationId())
    controller_->togglePin(*id);
}

void SidebarApp::moveSelectedToFolder()
{
  auto id = selectedConversationId();
  if (!id)
    return;

  const auto &folders = store_->folders();
  std::vector<std::string> labels{"(No folder)"};
  std::size_t initial = 0;
  const auto current = store_->folderOf(*id);
  for (std::size_t i = 0; i < folders.size(); ++i)
  {
    labels.push_back(folders[i].name);
    if (current == folders[i].id)
      initial = i + 1;
  }
  labels.push_back("New folder...");

  auto choice = pickFromList("Move to Folder", "Destination:", labels, initial);
  if (!choice)
    return;
  if (*choice == 0)
  {
    controller_->moveToFolder(*id, std::nullopt);
    return;
  }
  if (*choice == labels.size() - 1)
  {
    std::string name;
    if (!prompt_text("New Folder", "~N~ame", name))
      return;
    const std::string folderId = controller_->createFolder(name);
    controller_->moveToFolder(*id, folderId);
    return;
  }
  controller_->moveToFolder(*id, folders[*choice - 1].id);
}

void SidebarApp::archiveSelected()
{
  if (auto id = selectedConversationId())
    controller_->archive(*id);
}

void SidebarApp::restoreArchived()
{
  std::vector<std::string> ids;
  std::vector<std::string> labels;
  for (const auto &conversation : store_->conversations())
  {
    if (!store_->isArchived(conversation.id))
      continue;
    ids.push_back(conversation.id);
    labels.push_back(conversation.title.empty() ? conversation.id : conversation.title);
  }
  if (ids.empty())
  {
    messageBox("Nothing is archived.", mfInformation | mfOKButton);
    return;
  }
  if (auto choice = pickFromList("Restore Archived", "Conversation:", labels))
    controller_->unarchive(ids[*choice]);
}

void SidebarApp::renameSelected()
{
  if (auto folderId = selectedFolderId())
  {
    auto folder = store_->findFolder(*folderId);
    std::string name = folder ? folder->name : std::string();
    controller_->beginRename(*folderId);
    if (prompt_text("Rename Folder", "~N~ame", name))
      controller_->renameFolder(*folderId, name);
    controller_->cancelRename();
    return;
  }

  auto id = selectedConversationId();
  if (!id)
    return;
  auto conversation = store_->findConversation(*id);
  std::string title = conversation ? conversation->title : std::string();
  controller_->beginRename(*id);
  if (prompt_text("Rename Conversation", "~T~itle", title))
    controller_->renameConversation(*id, title);
  controller_->cancelRename();
}

void SidebarApp::deleteSelected()
{
  if (selectedFolderId())
  {
    deleteFolder();
    return;
  }
  auto id = selectedConversationId();
  if (!id)
    return;
  auto conversation = store_->findConversation(*id);
  std::string question = "Delete \"" + (conversation ? conversation->title : *id) + "\"?";
  if (messageBox(question.c_str(), mfConfirmation | mfYesButton | mfNoButton) != cmYes)
    return;
  controller_->deleteConversation(*id);
}

void SidebarApp::newFolder()
{
  std::string name;
  if (!prompt_text("New Folder", "~N~ame", name))
    return;
  const std::string id = controller_->createFolder(name);
  convo::log::info("Created folder " + id);
}

void SidebarApp::renameFolder()
{
  auto folderId = selectedFolderId();
  if (!folderId)
    folderId = chooseFolder("Rename Folder");
  if (!folderId)
    return;
  auto folder = store_->findFolder(*folderId);
  std::string name = folder ? folder->name : std::string();
  if (prompt_text("Rename Folder", "~N~ame", name))
    controller_->renameFolder(*folderId, name);
}

void SidebarApp::deleteFolder()
{
  auto folderId = selectedFolderId();
  if (!folderId)
    folderId = chooseFolder("Delete Folder");
  if (!folderId)
    return;
  auto folder = store_->findFolder(*folderId);
  std::string question = "Delete folder \"" + (folder ? folder->name : *folderId) +
                         "\"? Its conversations move back to Recent.";
  if (messageBox(question.c_str(), mfConfirmation | mfYesButton | mfNoButton) != cmYes)
    return;
  controller_->deleteFolder(*folderId);
}

void SidebarApp::setAllFoldersExpanded(bool expanded)
{
  for (const auto &folder : store_->folders())
  {
    if (controller_->isFolderExpanded(folder.id) != expanded)
      controller_->toggleFolderExpanded(folder.id);
  }
}

void SidebarApp::search()
{
  std::string query = controller_->searchQuery();
  if (!prompt_text("Search", "~T~itle contains", query))
    return;
  controller_->setSearchQuery(query);
}

void SidebarApp::toggleShowLastMessage()
{
  showLastMessage_ = !showLastMessage_;
  persistBoolOption(convo::chat::kOptionShowLastMessage, showLastMessage_);
  if (window_)
    window_->setShowLastMessage(showLastMessage_);
  rebuildMenuBar();
}

void SidebarApp::selectProject(std::optional<std::size_t> index)
{
  if (index && *index >= menuProjects_.size())
    return;
  controller_->setActiveProject(index ? std::optional<std::string>(menuProjects_[*index].id) : std::nullopt);
  rebuildMenuBar();
}

void SidebarApp::persistBoolOption(const std::string &key, bool value)
{
  if (!optionRegistry_)
    return;
  convo::config::OptionValue desired(value);
  if (optionRegistry_->get(key) == desired)
    return;
  optionRegistry_->set(key, desired);
  if (!optionRegistry_->saveDefaults())
    convo::log::warning("Unable to save " + optionRegistry_->defaultOptionsPath().string());
}

void SidebarApp::reportStatus(const std::string &message)
{
  convo::log::info(message);
  if (window_)
    window_->setStatus(message);
}

void SidebarApp::reportError(const std::string &error)
{
  convo::log::error(error);
  if (window_)
    window_->setStatus(error);
  messageBox(error.c_str(), mfError | mfOKButton);
}
