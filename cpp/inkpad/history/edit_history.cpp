#include "inkpad/history/edit_history.h"
#include "inkpad/capture/stroke_capture.h"
#include "inkpad/document/stroke_collection.h"
#include "inkpad/render/render_sink.h"
#include "inkpad/core/logging.h"

namespace inkpad {

EditHistory::EditHistory(StrokeCollection& strokes, StrokeCapture& capture, RenderSink& sink)
    : strokes_(strokes), capture_(capture), sink_(sink) {}

void EditHistory::clear() {
    capture_.abort();
    strokes_.clear();
    sink_.clearAll();
    sink_.refresh();
    clearCount_++;
}

bool EditHistory::undo() {
    capture_.abort();
    const bool removed = strokes_.removeLast();
    if (removed) {
        sink_.removeLastStroke();
        undoCount_++;
    } else {
        INKPAD_LOG_DEBUG("undo on empty stroke collection");
    }
    sink_.refresh();
    return removed;
}

} // namespace inkpad
