#pragma once

#include "convo/sidebar/sidebar_controller.hpp"

#include "../tvision_include.hpp"

#include <cstddef>
#include <string>

class TScrollBar;

// Draws only the rows inside the controller's window. Everything above and
// below is left as blank space that the scroll bar accounts for.
class ConversationListView : public TView
{
public:
    ConversationListView(const TRect &bounds, convo::sidebar::SidebarController &controller,
                         TScrollBar *vScrollBar);

    virtual void draw() override;
    virtual void handleEvent(TEvent &event) override;
    virtual void changeBounds(const TRect &bounds) override;
    virtual TPalette &getPalette() const override;

    void setShowLastMessage(bool show);
    bool showLastMessage() const noexcept { return showLastMessage_; }

    // Re-measures the materialized rows and updates the scroll bar. Called
    // whenever the composed sequence changed.
    void sidebarChanged();

    static int renderedHeight(const convo::sidebar::ComposedListItem &item, bool showLastMessage);

private:
    void measureWindow();
    void syncScrollBar();
    void scrolled();
    void drawItem(TDrawBuffer &buffer, std::size_t index, int line, TColorAttr normal,
                  TColorAttr selected) const;
    void postCommand(ushort command);

    convo::sidebar::SidebarController &controller_;
    TScrollBar *vScrollBar_ = nullptr;
    bool showLastMessage_ = true;
    bool syncingScrollBar_ = false;
};
