#include "tile_pyramid/distributed/tile_payload.hpp"
#include "tile_pyramid/core/errors.hpp"

#include <nlohmann/json.hpp>

namespace tile_pyramid::distributed {

using json = nlohmann::json;

namespace {

json shape_of(const Matrix2Df& m) {
    return json::array({static_cast<int>(m.rows()), static_cast<int>(m.cols())});
}

json data_of(const Matrix2Df& m) {
    return std::vector<float>(m.data(), m.data() + m.size());
}

Matrix2Df read_array(const json& j, const char* shape_key, const char* data_key) {
    if (!j.contains(shape_key) || !j.contains(data_key)) {
        throw ValidationError(std::string("payload lacks ") + shape_key + "/" + data_key);
    }
    const auto shape = j.at(shape_key).get<std::vector<int>>();
    if (shape.size() != 2 || shape[0] < 0 || shape[1] < 0) {
        throw ValidationError(std::string(shape_key) + " must be [rows, cols]");
    }
    const auto data = j.at(data_key).get<std::vector<float>>();
    if (data.size() != static_cast<size_t>(shape[0]) * static_cast<size_t>(shape[1])) {
        throw ValidationError(std::string(data_key) + " has " + std::to_string(data.size()) +
                              " values, shape needs " + std::to_string(shape[0] * shape[1]));
    }
    return Eigen::Map<const Matrix2Df>(data.data(), shape[0], shape[1]);
}

} // namespace

pyramid::TileSlice TileUpdatePayload::slice() const {
    pyramid::TileSlice s;
    s.tile = tile;
    s.tile_col = tile_col;
    s.tile_row = tile_row;
    s.width = static_cast<int>(frame.cols());
    s.height = static_cast<int>(frame.rows());
    return s;
}

std::string encode_payload(const TileUpdatePayload& payload) {
    json j;
    j["frame_shape"] = shape_of(payload.frame);
    j["frame_data"] = data_of(payload.frame);
    j["weights_shape"] = shape_of(payload.weights);
    j["weights_data"] = data_of(payload.weights);
    j["coords"] = {payload.tile.x, payload.tile.y};
    j["offset"] = {payload.tile_col, payload.tile_row};
    return j.dump();
}

TileUpdatePayload decode_payload(const std::string& body) {
    TileUpdatePayload p;
    try {
        const json j = json::parse(body);
        p.frame = read_array(j, "frame_shape", "frame_data");
        p.weights = read_array(j, "weights_shape", "weights_data");

        const auto coords = j.at("coords").get<std::vector<int>>();
        if (coords.size() != 2) {
            throw ValidationError("coords must be [x, y]");
        }
        p.tile = {coords[0], coords[1]};

        if (j.contains("offset")) {
            const auto offset = j.at("offset").get<std::vector<int>>();
            if (offset.size() != 2) {
                throw ValidationError("offset must be [col, row]");
            }
            p.tile_col = offset[0];
            p.tile_row = offset[1];
        }
    } catch (const json::exception& e) {
        throw ValidationError(std::string("malformed tile payload: ") + e.what());
    }

    if (p.frame.rows() != p.weights.rows() || p.frame.cols() != p.weights.cols()) {
        throw ValidationError("frame and weights shapes differ");
    }
    if (p.tile.x < 0 || p.tile.y < 0) {
        throw ValidationError("tile coordinates must be >= 0");
    }
    return p;
}

} // namespace tile_pyramid::distributed
