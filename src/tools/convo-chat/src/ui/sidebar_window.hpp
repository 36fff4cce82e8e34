#pragma once

#include "convo/sidebar/sidebar_controller.hpp"

#include "../tvision_include.hpp"

#include <string>

class ConversationListView;
class ConversationDetailView;
class StatusTextView;

class SidebarWindow : public TWindow
{
public:
    SidebarWindow(const TRect &bounds, convo::sidebar::SidebarController &controller);

    virtual void sizeLimits(TPoint &min, TPoint &max) override;

    void sidebarChanged();
    void showConversation(const convo::store::Conversation &conversation);
    void setStatus(const std::string &text);
    void setShowLastMessage(bool show);
    bool showLastMessage() const noexcept;
    void focusList();

private:
    void updateTitle();

    convo::sidebar::SidebarController &controller_;
    ConversationListView *list_ = nullptr;
    ConversationDetailView *detail_ = nullptr;
    StatusTextView *status_ = nullptr;
};
