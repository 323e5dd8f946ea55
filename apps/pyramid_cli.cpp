#include "tile_pyramid/builder/pyramid_builder.hpp"
#include "tile_pyramid/config/configuration.hpp"
#include "tile_pyramid/core/errors.hpp"
#include "tile_pyramid/core/events.hpp"
#include "tile_pyramid/core/utils.hpp"
#include "tile_pyramid/distributed/distributed_pyramid.hpp"
#include "tile_pyramid/distributed/partial_pyramid.hpp"
#include "tile_pyramid/distributed/qt_http_transport.hpp"
#include "tile_pyramid/distributed/tile_update_server.hpp"
#include "tile_pyramid/io/fits_io.hpp"
#include "tile_pyramid/pyramid/image_pyramid.hpp"

#include <QCoreApplication>
#include <QTimer>

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

namespace core = tile_pyramid::core;
namespace config = tile_pyramid::config;
namespace builder = tile_pyramid::builder;
namespace dist = tile_pyramid::distributed;
namespace pyr = tile_pyramid::pyramid;

std::atomic<bool> g_stop_requested{false};

void on_stop_signal(int) { g_stop_requested.store(true); }

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

protected:
  int overflow(int c) override {
    if (c == EOF)
      return EOF;
    const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
    const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
    return (ra == EOF || rb == EOF) ? EOF : c;
  }

  int sync() override {
    int ra = a_ ? a_->pubsync() : 0;
    int rb = b_ ? b_->pubsync() : 0;
    return (ra == 0 && rb == 0) ? 0 : -1;
  }

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

config::Config load_config(const std::string &config_path) {
  config::Config cfg;
  if (!config_path.empty()) {
    cfg = config::Config::load(config_path);
  }
  return cfg;
}

dist::DistributedOptions distributed_options(const config::Config &cfg) {
  dist::DistributedOptions d;
  d.servers = cfg.distributed.servers;
  d.chunk_shape = cfg.distributed.chunk_shape;
  d.timeout_s = cfg.distributed.timeout_s;
  d.repeats = cfg.distributed.repeats;
  d.pyramid_name = cfg.distributed.pyramid_name;
  return d;
}

int build_command(const std::string &dataset_dir, const std::string &out_dir,
                  const std::string &config_path, int tile_size,
                  const std::string &backend) {
  config::Config cfg = load_config(config_path);
  if (tile_size > 0)
    cfg.pyramid.tile_size = tile_size;
  if (!backend.empty())
    cfg.pyramid.backend = backend;
  cfg.validate();

  fs::create_directories(out_dir);
  std::ofstream event_log_file(fs::path(out_dir) / "events.jsonl",
                               std::ios::out | std::ios::trunc);
  if (!event_log_file) {
    std::cerr << "Error: cannot open events log file in " << out_dir
              << std::endl;
    return 1;
  }
  TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream event_out(&tee_buf);

  builder::BuildOptions opts = builder::BuildOptions::from_config(cfg);
  opts.run_id = core::get_run_id();
  opts.events = &event_out;

  if (cfg.distributed.enabled) {
    const dist::DistributedOptions d = distributed_options(cfg);
    opts.make_pyramid = dist::distributed_pyramid_factory(
        out_dir, d, [] { return std::make_unique<dist::QtHttpTransport>(); });
    std::cerr << "[DIST] Distributing level-0 tiles over "
              << d.servers.size() << " server(s)" << std::endl;
  }

  core::EventEmitter emitter;
  emitter.run_start(opts.run_id,
                    {{"dataset", dataset_dir}, {"output", out_dir},
                     {"tile_size", cfg.pyramid.tile_size},
                     {"backend", cfg.pyramid.backend}},
                    event_out);

  try {
    builder::BuildResult result =
        builder::create_pyramid_from_dataset(dataset_dir, out_dir, opts);
    std::cout << "Frames: " << result.frames_used << " used, "
              << result.frames_skipped << " skipped" << std::endl;
    std::cout << "Depth: " << result.pyramids.front()->depth() << std::endl;
  } catch (const tile_pyramid::TilePyramidError &e) {
    emitter.error(opts.run_id, e.what(), event_out);
    emitter.run_end(opts.run_id, false, "error", event_out);
    throw;
  }

  emitter.run_end(opts.run_id, true, "ok", event_out);
  return 0;
}

int info_command(const std::string &pyramid_dir) {
  auto pyramid = pyr::ImagePyramid::load_existing(pyramid_dir);
  std::cout << pyramid->metadata().to_json().dump(2) << std::endl;
  for (int layer = 0; layer <= pyramid->depth(); ++layer) {
    std::cout << "layer " << layer << ": "
              << pyramid->get_layer_tile_coords(layer).size() << " tiles"
              << std::endl;
  }
  return 0;
}

int rebuild_command(const std::string &pyramid_dir) {
  auto pyramid = pyr::ImagePyramid::load_existing(pyramid_dir);
  if (pyramid->metadata().has("Distributed.Servers")) {
    throw tile_pyramid::ValidationError(
        "pyramid tiles live on the workers; rebuild them with their "
        "update_pyramid endpoint or a new distributed build");
  }
  pyramid->update_pyramid();
  std::cout << "Depth: " << pyramid->depth() << std::endl;
  return 0;
}

int export_tile_command(const std::string &pyramid_dir, int layer, int x, int y,
                        int span, const std::string &out_path) {
  auto pyramid = pyr::ImagePyramid::load_existing(pyramid_dir);
  if (!pyramid->pyramid_valid()) {
    std::cerr << "[WARNING] pyramid has unmerged base data; run 'rebuild' "
                 "for up-to-date upper layers"
              << std::endl;
  }
  tile_pyramid::Matrix2Df tile = pyramid->get_oversize_tile(layer, x, y, span);

  tile_pyramid::io::FitsHeader header;
  header.set("PYRLAYER", static_cast<double>(layer));
  header.set("TILEX", static_cast<double>(x));
  header.set("TILEY", static_cast<double>(y));
  header.set("TILESPAN", static_cast<double>(span));
  tile_pyramid::io::write_fits_float(out_path, tile, header);
  std::cout << "Wrote " << tile.cols() << "x" << tile.rows() << " to "
            << out_path << std::endl;
  return 0;
}

std::unique_ptr<dist::PartialPyramid>
open_worker_pyramid(const fs::path &dir, const config::Config &cfg) {
  if (fs::exists(dir / tile_pyramid::io::kMetadataFilename)) {
    return dist::PartialPyramid::load_existing(
        dir, static_cast<size_t>(cfg.pyramid.cache_size));
  }
  // Placement and acquisition metadata arrive with the client's finalize
  // request.
  pyr::PyramidOptions popts;
  popts.tile_size = cfg.pyramid.tile_size;
  popts.backend = config::parse_backend(cfg.pyramid.backend);
  popts.cache_size = static_cast<size_t>(cfg.pyramid.cache_size);
  popts.occupancy_threshold = cfg.pyramid.occupancy_threshold;
  auto pyramid = std::make_unique<dist::PartialPyramid>(dir, popts);
  pyramid->save_metadata();
  return pyramid;
}

int serve_command(QCoreApplication &qapp, const std::string &pyramid_dir,
                  const std::string &config_path, int port,
                  std::vector<std::string> names) {
  config::Config cfg = load_config(config_path);
  if (port > 0)
    cfg.server.port = port;
  cfg.validate();
  if (names.empty())
    names.push_back(cfg.distributed.pyramid_name);

  // One pyramid per served name; several names live in subdirectories.
  std::vector<std::unique_ptr<dist::PartialPyramid>> pyramids;
  std::vector<std::unique_ptr<dist::TileUpdateService>> services;
  std::vector<dist::TileUpdateService *> routes;
  for (const std::string &name : names) {
    const fs::path dir =
        names.size() == 1 ? fs::path(pyramid_dir) : fs::path(pyramid_dir) / name;
    pyramids.push_back(open_worker_pyramid(dir, cfg));
    services.push_back(
        std::make_unique<dist::TileUpdateService>(*pyramids.back(), name));
    routes.push_back(services.back().get());
  }

  dist::TileUpdateServer server(routes);
  server.listen(cfg.server.bind, cfg.server.port);

  std::signal(SIGINT, on_stop_signal);
  std::signal(SIGTERM, on_stop_signal);
  QTimer stop_poll;
  QObject::connect(&stop_poll, &QTimer::timeout, &qapp, [&qapp] {
    if (g_stop_requested.load())
      qapp.quit();
  });
  stop_poll.start(200);

  const int rc = qapp.exec();
  std::cerr << "[SERVER] Shutting down, flushing " << pyramids.size()
            << " pyramid(s)" << std::endl;
  for (auto &pyramid : pyramids) {
    pyramid->flush();
    pyramid->save_metadata();
  }
  return rc;
}

} // namespace

int main(int argc, char *argv[]) {
  QCoreApplication qapp(argc, argv); // needed for Qt6::Network event loop

  CLI::App app{"Tile pyramid builder"};

  std::string dataset_dir, out_dir, config_path, backend, pyramid_dir,
      out_path;
  int tile_size = 0;
  int layer = 0, tile_x = 0, tile_y = 0, span = 1;
  int port = 0;

  auto build_cmd =
      app.add_subcommand("build", "Build a pyramid from a stored acquisition");
  build_cmd->add_option("--dataset", dataset_dir, "Acquisition directory")
      ->required();
  build_cmd->add_option("--out", out_dir, "Pyramid directory")->required();
  build_cmd->add_option("--config", config_path, "Path to config.yaml");
  build_cmd->add_option("--tile-size", tile_size, "Base tile size in pixels");
  build_cmd->add_option("--backend", backend, "Tile storage: tpz|npy|db");

  auto info_cmd = app.add_subcommand("info", "Show pyramid metadata");
  info_cmd->add_option("--pyramid", pyramid_dir, "Pyramid directory")
      ->required();

  auto rebuild_cmd = app.add_subcommand(
      "rebuild", "Rebuild level 0 images and upper layers");
  rebuild_cmd->add_option("--pyramid", pyramid_dir, "Pyramid directory")
      ->required();

  auto export_cmd =
      app.add_subcommand("export-tile", "Write a (span x span) tile to FITS");
  export_cmd->add_option("--pyramid", pyramid_dir, "Pyramid directory")
      ->required();
  export_cmd->add_option("--layer", layer, "Pyramid layer")->required();
  export_cmd->add_option("--x", tile_x, "Tile x index")->required();
  export_cmd->add_option("--y", tile_y, "Tile y index")->required();
  export_cmd->add_option("--out", out_path, "Output FITS file")->required();
  export_cmd->add_option("--span", span, "Tiles per side")->default_val(1);

  auto serve_cmd =
      app.add_subcommand("serve", "Accept distributed tile updates over HTTP");
  serve_cmd->add_option("--pyramid", pyramid_dir, "Pyramid directory")
      ->required();
  serve_cmd->add_option("--config", config_path, "Path to config.yaml");
  serve_cmd->add_option("--port", port, "Listen port");
  std::vector<std::string> serve_names;
  serve_cmd->add_option("--name", serve_names,
                        "Pyramid name to accept (repeatable, one per channel)");

  app.require_subcommand(1);
  CLI11_PARSE(app, argc, argv);

  try {
    if (build_cmd->parsed()) {
      return build_command(dataset_dir, out_dir, config_path, tile_size,
                           backend);
    }
    if (info_cmd->parsed()) {
      return info_command(pyramid_dir);
    }
    if (rebuild_cmd->parsed()) {
      return rebuild_command(pyramid_dir);
    }
    if (export_cmd->parsed()) {
      return export_tile_command(pyramid_dir, layer, tile_x, tile_y, span,
                                 out_path);
    }
    if (serve_cmd->parsed()) {
      return serve_command(qapp, pyramid_dir, config_path, port,
                           serve_names);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
