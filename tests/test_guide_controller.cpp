#include "guide_controller.hpp"
#include <cassert>
#include <chrono>
#include <optional>
#include <string>
#include <variant>

using namespace std::chrono_literals;

struct FakeHost : IGuideHost {
  TextBuffer buf;
  Cursor cur{};
  VisibleRange visible{0, 100};
  bool prompt = false;
  bool eligible = true;
  bool gui = false;
  CellSize nominal{1, 1};
  std::optional<CellSize> cursor_cell;

  const TextBuffer& buffer() const override { return buf; }
  Cursor cursor() const override { return cur; }
  int tab_width() const override { return 4; }
  VisibleRange visible_range() const override { return visible; }
  bool prompt_active() const override { return prompt; }
  bool context_eligible() const override { return eligible; }
  bool graphical() const override { return gui; }
  CellSize nominal_cell() const override { return nominal; }
  std::optional<CellSize> row_cell(int row) const override {
    if (row == cur.row) return cursor_cell;
    return std::nullopt;
  }
};

static void command(GuideController& g) {
  g.pre_command();
  g.post_command();
}

int main() {
  FakeHost host;
  IdleTimers::Clock::time_point now{};
  IdleTimers timers([&now] { return now; });

  // blank row inside the block keeps the guide going
  host.buf = TextBuffer::from_text("if x:\n    a\n\n    b\nc\n");
  host.cur = Cursor{1, 4};
  {
    GuideController g(host, timers);
    assert(g.state() == GuideState::Idle);
    g.post_command();
    assert(g.state() == GuideState::Drawn);
    assert(g.spans().size() == 1);
    assert((g.spans()[0] == GuideSpan{0, 3, 0, 4}));
    assert(g.annotations().size() == 3);
    assert(g.annotations()[1].row == 2 && g.annotations()[1].mode == AnnotationMode::AppendAfterEnd);

    // same cursor, same span, same glyph instances
    auto spans = g.spans();
    auto first = g.annotations();
    command(g);
    assert(g.spans() == spans);
    assert(g.annotations().size() == first.size());
    for (size_t i = 0; i < first.size(); ++i) assert(g.annotations()[i].glyph == first[i].glyph);

    g.pre_command();
    assert(g.state() == GuideState::Idle && g.annotations().empty() && g.spans().empty());

    // top-level code draws nothing
    host.cur = Cursor{4, 0};
    g.post_command();
    assert(g.spans().empty() && g.annotations().empty());

    // nothing under the caret
    host.cur = Cursor{3, 0};
    command(g);
    assert(g.annotations().size() == 2);
    for (const auto& a : g.annotations()) assert(a.row != 3);
  }

  // a whitespace-only row shorter than the guide column is padded
  host.buf = TextBuffer::from_text("def f():\n    if x:\n        a\n  \n        b\n");
  host.cur = Cursor{4, 8};
  {
    GuideController g(host, timers);
    g.post_command();
    assert((g.spans().at(0) == GuideSpan{1, 4, 4, 8}));
    assert(g.annotations().size() == 3);
    const Annotation& pad = g.annotations()[1];
    assert(pad.row == 3 && pad.mode == AnnotationMode::AppendAfterEnd && pad.offset == 2);
    assert(std::get<TextGlyph>(*pad.glyph).text == "  |");
  }

  // threshold boundary
  {
    GuideOptions o;
    o.threshold = 2;
    GuideController g(host, timers, o);
    host.buf = TextBuffer::from_text("a\n  b:\n    c\n");
    host.cur = Cursor{2, 4};
    g.post_command();
    assert(g.spans().empty() && g.annotations().empty());
    host.buf = TextBuffer::from_text("a\n   b:\n     c\n");
    host.cur = Cursor{2, 5};
    command(g);
    assert(g.spans().size() == 1 && g.spans()[0].column == 3);
    assert(g.annotations().size() == 1);
  }

  // the opener, the cursor and the end stay ordered on every row, blank ones included
  host.buf = TextBuffer::from_text("class A:\n\tdef f(self):\n\t\tif x:\n            y = 1\n\n\t\t\tz = 2\n  \n"
                                   "\t\treturn\n\n\tpass\n\n");
  {
    GuideController g(host, timers);
    for (int row = 0; row < host.buf.line_count(); ++row) {
      host.cur = Cursor{row, 0};
      command(g);
      if (locate_level(host.buf, row, 4).level == 0) {
        assert(g.spans().empty());
        continue;
      }
      assert(g.spans().size() == 1);
      const GuideSpan& s = g.spans()[0];
      assert(s.start_row <= row && row <= s.end_row);
      assert(s.column < s.level);
    }
  }

  // cursor on a trailing blank row of a nested block keeps that row in the span
  host.buf = TextBuffer::from_text("def f():\n  if x:\n    c\n\n  d\n");
  host.cur = Cursor{3, 0};
  {
    GuideController g(host, timers);
    g.post_command();
    assert((g.spans().at(0) == GuideSpan{1, 3, 2, 4}));
    // the padding on row 3 would sit under the caret
    assert(g.annotations().size() == 1 && g.annotations()[0].row == 2);
    command(g);
    assert((g.spans().at(0) == GuideSpan{1, 3, 2, 4}));
  }

  // no opener above: the first row is part of the block and gets a guide
  host.buf = TextBuffer::from_text("    a\n    b\n");
  host.cur = Cursor{1, 4};
  {
    GuideController g(host, timers);
    g.post_command();
    assert((g.spans().at(0) == GuideSpan{0, 1, 0, 4}));
    assert(g.annotations().size() == 2);
    assert(g.annotations()[0].row == 0 && g.annotations()[1].row == 1);
  }

  // a command before the delay elapses cancels the scheduled render
  host.buf = TextBuffer::from_text("if x:\n    a\n    b\n");
  host.cur = Cursor{2, 4};
  {
    GuideOptions o;
    o.redraw_delay = 100ms;
    GuideController g(host, timers, o);
    g.post_command();
    assert(g.state() == GuideState::PendingRedraw && g.timer_pending());
    assert(g.annotations().empty());
    now += 50ms;
    assert(timers.fire_due() == 0);
    g.pre_command();
    assert(g.state() == GuideState::Idle && !g.timer_pending() && timers.pending() == 0);
    now += 1s;
    timers.fire_due();
    assert(g.annotations().empty());

    g.post_command();
    now += 99ms;
    timers.fire_due();
    assert(g.state() == GuideState::PendingRedraw);
    now += 1ms;
    assert(timers.fire_due() == 1);
    assert(g.state() == GuideState::Drawn && !g.timer_pending());
    assert(g.annotations().size() == 2);

    // a second post_command without a command in between does not rearm
    g.post_command();
    assert(!g.timer_pending());

    // option changes drop the pending render as well
    command(g);
    assert(g.timer_pending());
    g.set_options(o);
    assert(!g.timer_pending() && timers.pending() == 0 && g.state() == GuideState::Idle);

    g.redraw();
    assert(g.state() == GuideState::Drawn && g.annotations().size() == 2);
  }
  assert(timers.pending() == 0);

  // destroying the controller disarms its timer
  {
    GuideOptions o;
    o.redraw_delay = 10ms;
    GuideController g(host, timers, o);
    g.post_command();
    assert(timers.pending() == 1);
  }
  assert(timers.pending() == 0);

  // prompt, excluded context and the on/off switch skip the pipeline
  {
    GuideController g(host, timers);
    host.prompt = true;
    g.post_command();
    assert(g.state() == GuideState::Drawn && g.annotations().empty());
    host.prompt = false;
    host.eligible = false;
    command(g);
    assert(g.annotations().empty());
    host.eligible = true;
    GuideOptions off;
    off.enabled = false;
    g.set_options(off);
    g.post_command();
    assert(g.annotations().empty());
    g.set_options(GuideOptions{});
    g.post_command();
    assert(g.annotations().size() == 2);
  }

  // recursive mode walks out to the enclosing blocks
  host.buf = TextBuffer::from_text("def f():\n    if x:\n        a\n");
  host.cur = Cursor{2, 8};
  {
    GuideController g(host, timers);
    g.post_command();
    assert(g.spans().size() == 1 && g.spans()[0].column == 4);
    GuideOptions o;
    o.recursive = true;
    g.set_options(o);
    g.post_command();
    assert(g.spans().size() == 2);
    assert((g.spans()[1] == GuideSpan{0, 2, 0, 4}));
    assert(g.annotations().size() == 3);
  }

  // bitmap geometry from the cursor row, then the nominal cell, then fixed sizes
  host.gui = true;
  host.nominal = CellSize{7, 14};
  host.cursor_cell = CellSize{8, 16};
  {
    GuideOptions o;
    o.rich_glyphs = true;
    GuideController g(host, timers, o);
    g.post_command();
    const auto& bm = std::get<BitmapGlyph>(*g.annotations().at(0).glyph);
    assert(bm.width == 8 && bm.height == 16);

    host.cursor_cell.reset();
    command(g);
    const auto& nominal = std::get<BitmapGlyph>(*g.annotations().at(0).glyph);
    assert(nominal.width == 7 && nominal.height == 14);

    o.char_width = FixedMetric{10};
    o.height_adjustment = 2;
    g.set_options(o);
    g.post_command();
    const auto& fixed = std::get<BitmapGlyph>(*g.annotations().at(0).glyph);
    assert(fixed.width == 10 && fixed.height == 16);

    g.clear_cache();
    assert(g.cache().size() == 0);
  }
  return 0;
}
