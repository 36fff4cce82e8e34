#include "conversation_list_view.hpp"
#include "../commands.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace
{
using convo::sidebar::ComposedListItem;
using convo::sidebar::ConversationRowItem;
using convo::sidebar::FolderHeaderItem;
using convo::sidebar::SectionItem;

constexpr int kWheelStep = 3;

struct NamedColor
{
    std::string_view name;
    unsigned char bios;
};

constexpr std::array<NamedColor, 8> kFolderColors{{
    {"blue", 0x09},
    {"green", 0x0A},
    {"cyan", 0x0B},
    {"red", 0x0C},
    {"magenta", 0x0D},
    {"purple", 0x0D},
    {"yellow", 0x0E},
    {"white", 0x0F},
}};

std::optional<unsigned char> folderColor(const std::optional<std::string> &color)
{
    if (!color)
        return std::nullopt;
    std::string lowered;
    for (char ch : *color)
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    for (const auto &entry : kFolderColors)
    {
        if (entry.name == lowered)
            return entry.bios;
    }
    return std::nullopt;
}

std::string fitText(const std::string &text, int width)
{
    if (width <= 0)
        return std::string();
    if (static_cast<int>(text.size()) <= width)
        return text;
    if (width <= 3)
        return text.substr(0, static_cast<std::size_t>(width));
    return text.substr(0, static_cast<std::size_t>(width - 3)) + "...";
}

} // namespace

ConversationListView::ConversationListView(const TRect &bounds,
                                           convo::sidebar::SidebarController &controller,
                                           TScrollBar *vScrollBar)
    : TView(bounds), controller_(controller), vScrollBar_(vScrollBar)
{
    options |= ofSelectable | ofFirstClick;
    eventMask |= evBroadcast | evMouseWheel;
    growMode = gfGrowHiX | gfGrowHiY;
    controller_.setViewportHeight(size.y);
}

TPalette &ConversationListView::getPalette() const
{
    static TPalette palette("\x06\x07", 2);
    return palette;
}

void ConversationListView::setShowLastMessage(bool show)
{
    if (showLastMessage_ == show)
        return;
    showLastMessage_ = show;
    sidebarChanged();
}

int ConversationListView::renderedHeight(const ComposedListItem &item, bool showLastMessage)
{
    if (const auto *row = std::get_if<ConversationRowItem>(&item))
        return showLastMessage && !row->conversation.lastMessage.empty() ? 2 : 1;
    return 1;
}

void ConversationListView::sidebarChanged()
{
    measureWindow();
    syncScrollBar();
    drawView();
}

void ConversationListView::measureWindow()
{
    const auto &items = controller_.items();
    // Reporting a height can move the window; settle in a few passes.
    for (int pass = 0; pass < 4; ++pass)
    {
        const auto window = controller_.visibleWindow();
        bool changed = false;
        for (std::size_t i = window.first; i < window.last && i < items.size(); ++i)
        {
            const int height = renderedHeight(items[i], showLastMessage_);
            if (controller_.list().isMeasured(controller_.list().keys()[i]) &&
                controller_.list().heightAt(i) == height)
                continue;
            controller_.reportItemHeight(controller_.list().keys()[i], height);
            changed = true;
        }
        if (!changed)
            break;
    }
    controller_.checkEndReached();
}

void ConversationListView::syncScrollBar()
{
    if (!vScrollBar_)
        return;
    const auto &list = controller_.list();
    syncingScrollBar_ = true;
    vScrollBar_->setParams(list.scrollTop(), 0, list.maxScrollTop(), std::max(1, size.y - 1), 1);
    syncingScrollBar_ = false;
}

void ConversationListView::scrolled()
{
    measureWindow();
    syncScrollBar();
    drawView();
}

void ConversationListView::draw()
{
    auto colors = getColor(0x0201);
    const TColorAttr normal = colors[0];
    const TColorAttr selected = colors[1];

    const auto &list = controller_.list();
    const auto window = controller_.visibleWindow();
    const int scrollTop = list.scrollTop();

    TDrawBuffer buffer;
    for (int y = 0; y < size.y; ++y)
    {
        buffer.moveChar(0, ' ', normal, size.x);
        const int offset = scrollTop + y;
        if (!window.empty && offset < window.totalHeight)
        {
            const std::size_t index = list.indexAtOffset(offset);
            if (window.contains(index))
                drawItem(buffer, index, offset - list.offsetOf(index), normal, selected);
        }
        writeLine(0, y, size.x, 1, buffer);
    }

    if (window.empty)
    {
        const char *message = controller_.viewState() == convo::sidebar::SidebarController::ViewState::Loading
                                  ? "Loading conversations..."
                                  : "No conversations yet";
        buffer.moveChar(0, ' ', normal, size.x);
        buffer.moveStr(1, fitText(message, size.x - 1), normal);
        writeLine(0, 0, size.x, 1, buffer);
    }
}

void ConversationListView::drawItem(TDrawBuffer &buffer, std::size_t index, int line,
                                    TColorAttr normal, TColorAttr selected) const
{
    const auto &item = controller_.items()[index];
    const auto &key = controller_.list().keys()[index];
    const bool isSelected = controller_.selectedKey() == key;
    const bool isRenaming = controller_.renamingKey() == key;
    TColorAttr attr = isSelected ? selected : normal;

    if (const auto *section = std::get_if<SectionItem>(&item))
    {
        TColorAttr dim = normal;
        setFore(dim, TColorDesired(TColorBIOS(0x08)));
        buffer.moveStr(1, fitText(section->title, size.x - 1), dim);
        return;
    }

    if (const auto *header = std::get_if<FolderHeaderItem>(&item))
    {
        buffer.moveChar(0, ' ', attr, size.x);
        std::string text = std::string(header->expanded ? "v " : "> ") + header->name + " (" +
                           std::to_string(header->count) + ")";
        if (isRenaming)
            text += " [renaming]";
        if (!isSelected)
        {
            if (auto bios = folderColor(header->color))
                setFore(attr, TColorDesired(TColorBIOS(*bios)));
        }
        buffer.moveStr(1, fitText(text, size.x - 1), attr);
        return;
    }

    const auto &row = std::get<ConversationRowItem>(item);
    const int indent = row.inFolder ? 3 : 1;
    buffer.moveChar(0, ' ', attr, size.x);
    if (line == 0)
    {
        std::string title = row.conversation.title.empty() ? "(untitled)" : row.conversation.title;
        if (controller_.activeConversationId() == row.conversation.id)
            title = "* " + title;
        if (isRenaming)
            title += " [renaming]";
        buffer.moveStr(indent, fitText(title, size.x - indent), attr);
    }
    else
    {
        TColorAttr preview = attr;
        if (!isSelected)
            setFore(preview, TColorDesired(TColorBIOS(0x08)));
        buffer.moveStr(indent + 1, fitText(row.conversation.lastMessage, size.x - indent - 1), preview);
    }
}

void ConversationListView::handleEvent(TEvent &event)
{
    TView::handleEvent(event);

    if (event.what == evBroadcast && event.message.command == cmScrollBarChanged &&
        event.message.infoPtr == vScrollBar_ && vScrollBar_)
    {
        if (!syncingScrollBar_)
        {
            controller_.scrollTo(vScrollBar_->value);
            scrolled();
        }
        return;
    }

    if (event.what == evMouseWheel)
    {
        if (event.mouse.wheel == mwUp)
            controller_.scrollBy(-kWheelStep);
        else if (event.mouse.wheel == mwDown)
            controller_.scrollBy(kWheelStep);
        else
            return;
        scrolled();
        clearEvent(event);
        return;
    }

    if (event.what == evMouseDown)
    {
        TPoint local = makeLocal(event.mouse.where);
        const int offset = controller_.list().scrollTop() + local.y;
        if (!controller_.items().empty() && offset < controller_.list().totalHeight())
        {
            const std::size_t index = controller_.list().indexAtOffset(offset);
            controller_.selectIndex(index);
            if (event.mouse.eventFlags & meDoubleClick)
                controller_.activateSelected();
        }
        sidebarChanged();
        clearEvent(event);
        return;
    }

    if (event.what != evKeyDown)
        return;

    bool handled = true;
    switch (event.keyDown.keyCode)
    {
    case kbUp:
        controller_.selectPrevious();
        break;
    case kbDown:
        controller_.selectNext();
        break;
    case kbPgUp:
        controller_.selectPageUp();
        break;
    case kbPgDn:
        controller_.selectPageDown();
        break;
    case kbHome:
    {
        const auto &items = controller_.items();
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            if (controller_.selectIndex(i))
                break;
        }
        break;
    }
    case kbEnd:
    {
        const auto &items = controller_.items();
        for (std::size_t i = items.size(); i > 0; --i)
        {
            if (controller_.selectIndex(i - 1))
                break;
        }
        break;
    }
    case kbEnter:
        controller_.activateSelected();
        break;
    case kbRight:
    case kbLeft:
        if (const auto *item = controller_.selectedItem())
        {
            if (const auto *header = std::get_if<FolderHeaderItem>(item))
            {
                if (header->expanded == (event.keyDown.keyCode == kbLeft))
                    controller_.toggleFolderExpanded(header->id);
            }
        }
        break;
    case kbDel:
        postCommand(cmDeleteConversation);
        break;
    case kbF2:
        postCommand(cmRenameConversation);
        break;
    default:
        handled = false;
        break;
    }

    if (!handled)
    {
        switch (event.keyDown.charScan.charCode)
        {
        case 'p':
            postCommand(cmTogglePin);
            break;
        case 'm':
            postCommand(cmMoveToFolder);
            break;
        case 'a':
            postCommand(cmArchive);
            break;
        case '/':
            postCommand(cmSearch);
            break;
        default:
            return;
        }
    }

    sidebarChanged();
    clearEvent(event);
}

void ConversationListView::changeBounds(const TRect &bounds)
{
    TView::changeBounds(bounds);
    controller_.setViewportHeight(size.y);
    sidebarChanged();
}

void ConversationListView::postCommand(ushort command)
{
    TEvent event;
    event.what = evCommand;
    event.message.command = command;
    event.message.infoPtr = this;
    putEvent(event);
}
