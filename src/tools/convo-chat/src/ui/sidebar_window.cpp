#include "sidebar_window.hpp"
#include "conversation_list_view.hpp"

#include "convo/store/conversation_source.hpp"
#include "convo/store/entity_store.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace
{
constexpr int kListMinWidth = 24;
constexpr int kScrollBarWidth = 1;

std::vector<std::string> wrapText(const std::string &text, int width)
{
    std::vector<std::string> lines;
    if (width <= 0)
        return lines;
    std::istringstream words(text);
    std::string word;
    std::string line;
    while (words >> word)
    {
        while (static_cast<int>(word.size()) > width)
        {
            if (!line.empty())
            {
                lines.push_back(line);
                line.clear();
            }
            lines.push_back(word.substr(0, static_cast<std::size_t>(width)));
            word.erase(0, static_cast<std::size_t>(width));
        }
        if (line.empty())
            line = word;
        else if (static_cast<int>(line.size() + 1 + word.size()) <= width)
            line += ' ' + word;
        else
        {
            lines.push_back(line);
            line = word;
        }
    }
    if (!line.empty())
        lines.push_back(line);
    return lines;
}

} // namespace

class ConversationDetailView : public TView
{
public:
    explicit ConversationDetailView(const TRect &bounds)
        : TView(bounds)
    {
        options &= ~ofSelectable;
        growMode = gfGrowHiX | gfGrowHiY;
    }

    void setConversation(const convo::store::Conversation &conversation, std::string folderName,
                         bool pinned)
    {
        conversation_ = conversation;
        folderName_ = std::move(folderName);
        pinned_ = pinned;
        hasConversation_ = true;
        drawView();
    }

    void clear()
    {
        hasConversation_ = false;
        drawView();
    }

    const std::string &conversationId() const noexcept { return conversation_.id; }
    bool hasConversation() const noexcept { return hasConversation_; }

    virtual TPalette &getPalette() const override
    {
        static TPalette palette("\x06", 1);
        return palette;
    }

    virtual void draw() override
    {
        auto colors = getColor(1);
        TColorAttr attr = colors[0];
        TColorAttr dim = attr;
        setFore(dim, TColorDesired(TColorBIOS(0x08)));

        std::vector<std::pair<std::string, TColorAttr>> lines;
        if (!hasConversation_)
        {
            lines.emplace_back("Select a conversation and press Enter.", dim);
        }
        else
        {
            lines.emplace_back(conversation_.title.empty() ? "(untitled)" : conversation_.title, attr);
            std::string meta = convo::store::formatTimestamp(conversation_.timestamp) + " UTC";
            if (pinned_)
                meta += "  pinned";
            if (!folderName_.empty())
                meta += "  in " + folderName_;
            lines.emplace_back(meta, dim);
            lines.emplace_back(std::string(), attr);
            for (auto &line : wrapText(conversation_.lastMessage, size.x - 2))
                lines.emplace_back(std::move(line), attr);
        }

        TDrawBuffer buffer;
        for (int y = 0; y < size.y; ++y)
        {
            buffer.moveChar(0, ' ', attr, size.x);
            if (y < static_cast<int>(lines.size()))
                buffer.moveStr(1, lines[y].first, lines[y].second, size.x - 1);
            writeLine(0, y, size.x, 1, buffer);
        }
    }

private:
    convo::store::Conversation conversation_;
    std::string folderName_;
    bool pinned_ = false;
    bool hasConversation_ = false;
};

class StatusTextView : public TView
{
public:
    explicit StatusTextView(const TRect &bounds)
        : TView(bounds)
    {
        options &= ~ofSelectable;
        growMode = gfGrowLoY | gfGrowHiX | gfGrowHiY;
    }

    void setText(const std::string &text)
    {
        text_ = text;
        drawView();
    }

    virtual TPalette &getPalette() const override
    {
        static TPalette palette("\x06", 1);
        return palette;
    }

    virtual void draw() override
    {
        auto colors = getColor(1);
        TColorAttr attr = colors[0];
        setFore(attr, TColorDesired(TColorBIOS(0x08)));
        TDrawBuffer buffer;
        buffer.moveChar(0, ' ', attr, size.x);
        buffer.moveStr(1, text_, attr, size.x - 1);
        writeLine(0, 0, size.x, 1, buffer);
    }

private:
    std::string text_;
};

SidebarWindow::SidebarWindow(const TRect &bounds, convo::sidebar::SidebarController &controller)
    : TWindowInit(&SidebarWindow::initFrame),
      TWindow(bounds, "Conversations", wnNoNumber),
      controller_(controller)
{
    options |= ofTileable;

    TRect extent = getExtent();
    extent.grow(-1, -1);

    const int listWidth = std::max(kListMinWidth, (extent.b.x - extent.a.x) * 2 / 5);
    const short statusTop = static_cast<short>(extent.b.y - 1);

    TRect scrollRect(extent.a.x + listWidth, extent.a.y, extent.a.x + listWidth + kScrollBarWidth, statusTop);
    auto *scrollBar = new TScrollBar(scrollRect);
    scrollBar->growMode = gfGrowHiY;
    insert(scrollBar);

    TRect listRect(extent.a.x, extent.a.y, extent.a.x + listWidth, statusTop);
    list_ = new ConversationListView(listRect, controller_, scrollBar);
    list_->growMode = gfGrowHiY;
    insert(list_);

    TRect detailRect(scrollRect.b.x + 1, extent.a.y, extent.b.x, statusTop);
    detail_ = new ConversationDetailView(detailRect);
    insert(detail_);

    status_ = new StatusTextView(TRect(extent.a.x, statusTop, extent.b.x, extent.b.y));
    insert(status_);

    list_->select();
}

void SidebarWindow::sizeLimits(TPoint &min, TPoint &max)
{
    TWindow::sizeLimits(min, max);
    min.x = kListMinWidth + 20;
    min.y = 8;
}

void SidebarWindow::sidebarChanged()
{
    if (list_)
        list_->sidebarChanged();

    if (detail_ && detail_->hasConversation())
    {
        const auto &store = controller_.store();
        auto conversation = store.findConversation(detail_->conversationId());
        if (!conversation)
            detail_->clear();
        else
            showConversation(*conversation);
    }
    updateTitle();
}

void SidebarWindow::showConversation(const convo::store::Conversation &conversation)
{
    if (!detail_)
        return;
    const auto &store = controller_.store();
    std::string folderName;
    if (auto folderId = store.folderOf(conversation.id))
    {
        if (auto folder = store.findFolder(*folderId))
            folderName = folder->name;
    }
    detail_->setConversation(conversation, folderName, store.isPinned(conversation.id));
}

void SidebarWindow::setStatus(const std::string &text)
{
    if (status_)
        status_->setText(text);
}

void SidebarWindow::setShowLastMessage(bool show)
{
    if (list_)
        list_->setShowLastMessage(show);
}

bool SidebarWindow::showLastMessage() const noexcept
{
    return list_ && list_->showLastMessage();
}

void SidebarWindow::focusList()
{
    if (list_)
        list_->select();
}

void SidebarWindow::updateTitle()
{
    std::string text = "Conversations";
    if (const auto &project = controller_.activeProject())
    {
        const auto &projects = controller_.store().projects();
        auto it = std::find_if(projects.begin(), projects.end(),
                               [&](const convo::store::Project &p) { return p.id == *project; });
        text += " - " + (it != projects.end() ? it->name : *project);
    }
    if (!controller_.searchQuery().empty())
        text += " [" + controller_.searchQuery() + "]";
    if (controller_.loading())
        text += " (loading)";

    if (!title || text != title)
    {
        delete[] const_cast<char *>(title);
        title = newStr(text.c_str());
        if (frame)
            frame->drawView();
    }
}
