#include "pick_list_dialog.hpp"

#include <algorithm>
#include <cstring>

namespace
{

class LabelListViewer : public TListViewer
{
public:
    LabelListViewer(const TRect &bounds, TScrollBar *vScrollBar, std::vector<std::string> labels)
        : TListViewer(bounds, 1, nullptr, vScrollBar), labels_(std::move(labels))
    {
        setRange(static_cast<short>(labels_.size()));
    }

    virtual void getText(char *dest, short item, short maxLen) override
    {
        if (maxLen <= 0)
            return;
        dest[0] = '\0';
        if (item < 0 || static_cast<std::size_t>(item) >= labels_.size())
            return;
        const std::string &label = labels_[static_cast<std::size_t>(item)];
        const std::size_t length = std::min(label.size(), static_cast<std::size_t>(maxLen - 1));
        std::memcpy(dest, label.data(), length);
        dest[length] = '\0';
    }

    virtual void selectItem(short item) override
    {
        TListViewer::selectItem(item);
        message(owner, evCommand, cmOK, this);
    }

private:
    std::vector<std::string> labels_;
};

} // namespace

std::optional<std::size_t> pickFromList(const std::string &title, const std::string &prompt,
                                        const std::vector<std::string> &labels, std::size_t initial)
{
    if (labels.empty())
        return std::nullopt;

    const int visibleRows = std::clamp(static_cast<int>(labels.size()), 3, 12);
    const int height = visibleRows + 7;
    auto *dialog = new TDialog(TRect(0, 0, 50, height), title.c_str());
    dialog->options |= ofCentered;

    dialog->insert(new TStaticText(TRect(2, 2, 48, 3), prompt.c_str()));

    auto *scrollBar = new TScrollBar(TRect(46, 3, 47, 3 + visibleRows));
    dialog->insert(scrollBar);
    auto *viewer = new LabelListViewer(TRect(2, 3, 46, 3 + visibleRows), scrollBar, labels);
    if (initial < labels.size())
        viewer->focusItem(static_cast<short>(initial));
    dialog->insert(viewer);

    dialog->insert(new TButton(TRect(14, height - 3, 24, height - 1), "O~K~", cmOK, bfDefault));
    dialog->insert(new TButton(TRect(26, height - 3, 36, height - 1), "Cancel", cmCancel, bfNormal));
    viewer->select();

    ushort code = TProgram::application->execView(dialog);
    std::optional<std::size_t> result;
    if (code == cmOK && viewer->focused >= 0 && static_cast<std::size_t>(viewer->focused) < labels.size())
        result = static_cast<std::size_t>(viewer->focused);
    TObject::destroy(dialog);
    return result;
}
