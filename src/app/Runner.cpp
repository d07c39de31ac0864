#include "xpcs/app/Runner.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "xpcs/core/Errors.hpp"
#include "xpcs/correlate/CorrelatorFactory.hpp"
#include "xpcs/io/TextImageIO.hpp"
#include "xpcs/output/G2Table.hpp"
#include "xpcs/roi/RoiIndex.hpp"
#include "xpcs/util/AtomicFile.hpp"
#include "xpcs/util/Timer.hpp"

namespace fs = std::filesystem;

namespace xpcs {

Runner::Runner(const IniConfig& cfg) : cfg_(cfg) {}

int Runner::run() { return run_impl_(false); }

int Runner::validate_config() { return run_impl_(true); }

int Runner::run_impl_(bool validate_only) {
  util::WallTimer wall;

  cfg_.require_known_keys("input", {"frames", "labels", "mask"});
  cfg_.require_known_keys("correlation", {"correlator", "num_levels", "num_bufs", "roi_numbering", "frame_period"});
  cfg_.require_known_keys("output", {"dir", "file", "checkpoint", "resume_from"});

  const fs::path frames_path = cfg_.get_path("input", "frames");
  const fs::path labels_path = cfg_.get_path("input", "labels");
  const fs::path mask_path = cfg_.get_path("input", "mask");
  if (frames_path.empty()) throw std::runtime_error("input.frames is required");
  if (labels_path.empty()) throw std::runtime_error("input.labels is required");

  const CorrelatorSpec spec = parse_correlator_spec(cfg_);

  const fs::path out_dir = cfg_.get_path("output", "dir", std::optional<std::string>("."));
  const std::string out_file = cfg_.get_string("output", "file", std::optional<std::string>("g2.dat"));
  const fs::path out_path = (out_dir / out_file).lexically_normal();
  const fs::path ckpt_path = cfg_.get_path("output", "checkpoint");
  const fs::path resume_path = cfg_.get_path("output", "resume_from");
  if ((!ckpt_path.empty() || !resume_path.empty()) && spec.type != "multitau") {
    throw InvalidConfig("output.checkpoint / output.resume_from require correlator=multitau");
  }

  // --- ROI definition ---
  const LabelImage labels = read_label_image(labels_path);
  std::optional<MaskImage> mask;
  if (!mask_path.empty()) mask = read_mask_image(mask_path);
  RoiIndex roi = RoiIndex::build(labels, mask ? &(*mask) : nullptr, spec.numbering);

  FrameStackReader reader(frames_path);
  Frame frame;
  double reader_seconds = 0.0;
  bool have_frame = false;
  {
    util::ScopedTimer t(&reader_seconds);
    have_frame = reader.next(frame);
  }
  if (have_frame) roi.check_frame(frame);

  if (validate_only) {
    std::cerr << "[XPCS] validation OK (no frames correlated)\n"
              << "       correlator=" << spec.type << " num_levels=" << spec.num_levels
              << " num_bufs=" << spec.num_bufs << "\n"
              << "       detector=" << labels.shape_str() << " rois=" << roi.num_rois()
              << " pixels=" << roi.num_pixels() << (mask ? " (masked)" : "") << "\n";
    return 0;
  }

  // The correlator gets its own copy; `roi` still checks frames skipped on resume.
  std::unique_ptr<ICorrelator> corr = make_correlator(roi, spec);
  double corr_seconds = 0.0;
  corr->set_observer([&corr_seconds](std::uint64_t, double s) { corr_seconds = s; });

  std::uint64_t skip = 0;
  if (!resume_path.empty()) {
    std::ifstream ifs(resume_path, std::ios::binary);
    if (!ifs) throw std::runtime_error("cannot open checkpoint: " + resume_path.string());
    corr->load_state(ifs);
    skip = corr->frames_processed();
    std::cerr << "[XPCS] resumed from checkpoint: " << resume_path.string()
              << " (skipping " << skip << " frames)\n";
  }

  // --- Frame loop ---
  std::uint64_t seen = 0;
  while (have_frame) {
    if (seen >= skip) {
      corr->push(frame);
    } else {
      roi.check_frame(frame);
    }
    ++seen;
    util::ScopedTimer t(&reader_seconds);
    have_frame = reader.next(frame);
  }
  if (seen < skip) {
    throw std::runtime_error("checkpoint covers " + std::to_string(skip) + " frames but the input has only " +
                             std::to_string(seen));
  }

  const CorrelationResult res = corr->finalize();

  fs::create_directories(out_path.parent_path().empty() ? fs::path(".") : out_path.parent_path());
  G2TableInfo info;
  info.correlator = spec.type;
  info.num_levels = spec.num_levels;
  info.num_bufs = spec.num_bufs;
  info.frame_period = spec.frame_period;
  info.roi_numbering = roi_numbering_name(spec.numbering);
  write_g2_table(out_path, res, info);

  if (!ckpt_path.empty()) {
    util::atomic_write(ckpt_path, [&](std::ostream& os) { corr->save_state(os); }, true);
  }

  std::cerr << "[XPCS] profiling\n"
            << "  frames: " << res.num_frames << "\n"
            << "  rows: " << res.num_rows << "\n"
            << "  wall_seconds: " << std::setprecision(6) << wall.seconds() << "\n"
            << "  reader_seconds: " << reader_seconds << "\n"
            << "  correlator_seconds: " << corr_seconds << "\n"
            << "  output: " << out_path.string() << "\n";
  if (!ckpt_path.empty()) std::cerr << "  checkpoint: " << ckpt_path.string() << "\n";
  return 0;
}

} // namespace xpcs
