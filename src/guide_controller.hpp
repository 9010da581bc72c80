#pragma once
/*
 * GuideController
 *
 * Purpose: drive locate → expand → render once per command cycle and own the
 *          resulting annotations until the next command starts.
 * States: Idle → (post_command) → Drawn, or → PendingRedraw → (idle timer) → Drawn;
 *         pre_command always returns to Idle and drops annotations.
 * Note: at most one timer is in flight; a timer whose id no longer matches the
 *       stored handle does nothing when it fires.
 */
#include <optional>
#include <vector>
#include "glyph_cache.hpp"
#include "guide_host.hpp"
#include "guide_options.hpp"
#include "idle_timers.hpp"
#include "level_locator.hpp"
#include "line_renderer.hpp"
#include "span_expander.hpp"

enum class GuideState { Idle, PendingRedraw, Drawn };

class GuideController {
public:
  GuideController(IGuideHost& host, IdleTimers& timers, GuideOptions opts = {});
  GuideController(const GuideController&) = delete;
  GuideController& operator=(const GuideController&) = delete;
  ~GuideController();

  void pre_command();
  void post_command();
  /* runs the pipeline now, regardless of the configured delay */
  void redraw();

  void set_options(GuideOptions opts);
  const GuideOptions& options() const { return opts_; }
  void clear_cache();

  GuideState state() const { return state_; }
  bool timer_pending() const { return pending_.has_value(); }
  const std::vector<Annotation>& annotations() const { return annotations_; }
  const std::vector<GuideSpan>& spans() const { return spans_; }
  const GlyphCache& cache() const { return cache_; }

private:
  void clear_annotations();
  void cancel_timer();
  void on_timer(TimerId id);
  void run_pipeline();
  GuideRenderContext make_context() const;
  static GlyphStyle style_from(const GuideOptions& opts);

  IGuideHost& host_;
  IdleTimers& timers_;
  GuideOptions opts_;
  GlyphCache cache_;
  GuideState state_ = GuideState::Idle;
  std::optional<TimerId> pending_;
  std::vector<Annotation> annotations_;
  std::vector<GuideSpan> spans_;
};
