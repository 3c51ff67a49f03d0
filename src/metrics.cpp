#include <gscoach/metrics.hpp>
#include <cstdio>
#include <utility>

namespace gscoach {

const char* metric_label(Metric m) {
  switch (m) {
    case Metric::Gpm:      return "GPM";
    case Metric::Xpm:      return "XPM";
    case Metric::LastHits: return "Last hits";
  }
  return "?";
}

Trend classify_trend(double latest, double mean) {
  const double d = latest - mean;
  if (d >=  kTrendSignificant) return Trend::UpSignificantly;
  if (d >=  kTrendMild)        return Trend::Up;
  if (d <= -kTrendSignificant) return Trend::DownSignificantly;
  if (d <= -kTrendMild)        return Trend::Down;
  return Trend::Flat;
}

const char* trend_text(Trend t) {
  switch (t) {
    case Trend::UpSignificantly:   return "trending up significantly";
    case Trend::Up:                return "trending up";
    case Trend::Flat:              return "holding steady";
    case Trend::Down:              return "trending down";
    case Trend::DownSignificantly: return "trending down significantly";
  }
  return "";
}

std::optional<SeriesStats> MetricReport::find(Metric m) const {
  for (const auto& s : series) if (s.metric == m) return s;
  return std::nullopt;
}

std::vector<std::string> MetricReport::lines() const {
  std::vector<std::string> out;
  char buf[160];
  for (const auto& s : series) {
    std::snprintf(buf, sizeof(buf), "%s: %d (avg %.0f)", metric_label(s.metric), s.latest, s.mean);
    out.emplace_back(buf);
    if (s.trend != Trend::Flat) {
      std::snprintf(buf, sizeof(buf), "  %s %s", metric_label(s.metric), trend_text(s.trend));
      out.emplace_back(buf);
    }
  }
  if (cs_rate) {
    std::snprintf(buf, sizeof(buf), "CS/min: %.1f", cs_rate->per_minute);
    out.emplace_back(buf);
    const char* phase = cs_rate->phase.c_str();
    switch (cs_rate->rating) {
      case CsRating::Excellent:
        std::snprintf(buf, sizeof(buf), "  Excellent %s game CS", phase);
        out.emplace_back(buf);
        break;
      case CsRating::Good:
        std::snprintf(buf, sizeof(buf), "  Good %s game CS", phase);
        out.emplace_back(buf);
        break;
      case CsRating::Poor:
        std::snprintf(buf, sizeof(buf), "  %s game CS needs improvement", phase);
        out.emplace_back(buf);
        break;
      case CsRating::Average:
        break;
    }
  }
  return out;
}

MetricSampler::MetricSampler(BenchmarkCatalog benchmarks)
  : benchmarks_(std::make_shared<const BenchmarkCatalog>(std::move(benchmarks))) {}

MetricSampler::MetricSampler(std::shared_ptr<const BenchmarkCatalog> benchmarks)
  : benchmarks_(benchmarks ? std::move(benchmarks)
                           : std::make_shared<const BenchmarkCatalog>(benchmark_catalog())) {}

void MetricSampler::update(const Snapshot& s) {
  const GameClock now = s.clock();
  if (last_clock_ && now <= *last_clock_) return;
  last_clock_ = now;

  if (!s.player) return;
  const auto& p = *s.player;
  if (p.gpm)       gpm_.push({now, *p.gpm});
  if (p.xpm)       xpm_.push({now, *p.xpm});
  if (p.last_hits) last_hits_.push({now, *p.last_hits});
}

const MetricSeries& MetricSampler::series(Metric m) const {
  switch (m) {
    case Metric::Gpm: return gpm_;
    case Metric::Xpm: return xpm_;
    case Metric::LastHits: break;
  }
  return last_hits_;
}

std::optional<SeriesStats> MetricSampler::stats_(Metric m, const MetricSeries& s) {
  const std::size_t n = s.size();
  if (n < 2) return std::nullopt;
  double sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) sum += s[i].value;
  SeriesStats st{};
  st.metric = m;
  st.latest = s.back().value;
  st.mean = sum / double(n);
  st.trend = classify_trend(st.latest, st.mean);
  st.samples = n;
  return st;
}

MetricReport MetricSampler::report(GameClock now) const {
  MetricReport r;
  for (Metric m : {Metric::Gpm, Metric::Xpm, Metric::LastHits}) {
    if (auto st = stats_(m, series(m))) r.series.push_back(*st);
  }

  const auto lh = r.find(Metric::LastHits);
  const int minutes = now / 60;
  if (lh && minutes > 0) {
    if (auto bench = cs_benchmark_at(*benchmarks_, minutes)) {
      CsRate rate{};
      rate.per_minute = double(lh->latest) / double(minutes);
      rate.phase = bench->phase;
      if (rate.per_minute >= bench->excellent)  rate.rating = CsRating::Excellent;
      else if (rate.per_minute >= bench->good)  rate.rating = CsRating::Good;
      else if (rate.per_minute < bench->poor)   rate.rating = CsRating::Poor;
      else                                      rate.rating = CsRating::Average;
      r.cs_rate = rate;
    }
  }
  return r;
}

} // namespace gscoach
