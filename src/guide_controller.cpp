#include "guide_controller.hpp"
#include <algorithm>
#include <utility>
#include <spdlog/spdlog.h>

GuideController::GuideController(IGuideHost& host, IdleTimers& timers, GuideOptions opts)
    : host_(host), timers_(timers), opts_(std::move(opts)), cache_(style_from(opts_)) {}

GuideController::~GuideController() { cancel_timer(); }

GlyphStyle GuideController::style_from(const GuideOptions& opts) {
  GlyphStyle s;
  s.bar_text = opts.line_char;
  s.color = opts.color;
  s.dash_length = opts.dash_length;
  return s;
}

void GuideController::clear_annotations() {
  annotations_.clear();
  spans_.clear();
}

void GuideController::cancel_timer() {
  if (!pending_) return;
  timers_.cancel(*pending_);
  pending_.reset();
}

void GuideController::pre_command() {
  cancel_timer();
  clear_annotations();
  state_ = GuideState::Idle;
}

void GuideController::post_command() {
  if (state_ != GuideState::Idle) return;
  if (!opts_.redraw_delay) {
    run_pipeline();
    return;
  }
  pending_ = timers_.schedule(*opts_.redraw_delay, [this](TimerId id) { on_timer(id); });
  state_ = GuideState::PendingRedraw;
}

void GuideController::on_timer(TimerId id) {
  if (!pending_ || *pending_ != id) {
    spdlog::debug("[GuideController] stale timer {} ignored", id);
    return;
  }
  pending_.reset();
  if (state_ != GuideState::PendingRedraw) return;
  run_pipeline();
}

void GuideController::redraw() {
  cancel_timer();
  clear_annotations();
  run_pipeline();
}

void GuideController::set_options(GuideOptions opts) {
  opts_ = std::move(opts);
  cache_.set_style(style_from(opts_));
  cancel_timer();
  clear_annotations();
  state_ = GuideState::Idle;
}

void GuideController::clear_cache() { cache_.clear(); }

GuideRenderContext GuideController::make_context() const {
  GuideRenderContext ctx;
  ctx.tab_width = host_.tab_width();
  ctx.cursor = host_.cursor();
  ctx.color = opts_.color;
  ctx.rich = opts_.rich_glyphs && host_.graphical();
  ctx.left_margin = opts_.left_margin;
  ctx.height_adjustment = opts_.height_adjustment;
  CellSize derived = host_.row_cell(ctx.cursor.row).value_or(host_.nominal_cell());
  ctx.cell.width = resolve_metric(opts_.char_width, derived.width);
  ctx.cell.height = resolve_metric(opts_.char_height, derived.height);
  return ctx;
}

void GuideController::run_pipeline() {
  state_ = GuideState::Drawn;
  if (!opts_.enabled || host_.prompt_active() || !host_.context_eligible()) return;

  const TextBuffer& buf = host_.buffer();
  const int tab_width = host_.tab_width();
  const VisibleRange visible = host_.visible_range();
  LineRenderer renderer(cache_, make_context());

  // level 0 is top-level code: no enclosing block to draw
  BlockStart block = locate_level(buf, host_.cursor().row, tab_width);
  while (block.level > 0 && block.column > opts_.threshold) {
    GuideSpan span;
    span.start_row = block.start_row;
    span.column = block.column;
    span.level = block.level;
    span.end_row = expand_span(buf, block.column, block.start_row, visible, tab_width, host_.cursor().row);
    spans_.push_back(span);
    spdlog::debug("[GuideController] span rows {}-{} column {} level {}", span.start_row, span.end_row, span.column, span.level);

    int first = block.has_opener ? span.start_row + 1 : span.start_row;
    for (int row = std::max(first, visible.first_row); row <= span.end_row; ++row) {
      if (auto a = renderer.render(buf.line_view(row), row, span.column)) annotations_.push_back(std::move(*a));
    }
    if (!opts_.recursive || block.column == 0) break;
    BlockStart outer = locate_level(buf, block.start_row, tab_width);
    if (outer.start_row >= block.start_row) break;
    block = outer;
  }
}
