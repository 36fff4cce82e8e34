#pragma once

#include "convo/commands/convo_chat.hpp"

inline constexpr unsigned short cmAbout = convo::commands::chat::About;
inline constexpr unsigned short cmNewConversation = convo::commands::chat::NewConversation;
inline constexpr unsigned short cmOpenConversation = convo::commands::chat::OpenConversation;
inline constexpr unsigned short cmTogglePin = convo::commands::chat::TogglePin;
inline constexpr unsigned short cmMoveToFolder = convo::commands::chat::MoveToFolder;
inline constexpr unsigned short cmArchive = convo::commands::chat::Archive;
inline constexpr unsigned short cmRestoreArchived = convo::commands::chat::RestoreArchived;
inline constexpr unsigned short cmRenameConversation = convo::commands::chat::RenameConversation;
inline constexpr unsigned short cmDeleteConversation = convo::commands::chat::DeleteConversation;
inline constexpr unsigned short cmNewFolder = convo::commands::chat::NewFolder;
inline constexpr unsigned short cmRenameFolder = convo::commands::chat::RenameFolder;
inline constexpr unsigned short cmDeleteFolder = convo::commands::chat::DeleteFolder;
inline constexpr unsigned short cmExpandAllFolders = convo::commands::chat::ExpandAllFolders;
inline constexpr unsigned short cmCollapseAllFolders = convo::commands::chat::CollapseAllFolders;
inline constexpr unsigned short cmLoadMore = convo::commands::chat::LoadMore;
inline constexpr unsigned short cmSearch = convo::commands::chat::Search;
inline constexpr unsigned short cmClearSearch = convo::commands::chat::ClearSearch;
inline constexpr unsigned short cmShowLastMessage = convo::commands::chat::ShowLastMessage;
inline constexpr unsigned short cmProjectAll = convo::commands::chat::ProjectAll;
inline constexpr unsigned short cmProjectBase = convo::commands::chat::ProjectBase;
