#include "lazor/tracer.hpp"
#include <algorithm>

namespace lazor {

namespace {
// (dx, dy) → 4方向のビット
inline uint8_t direction_bit(int dx, int dy) {
    return static_cast<uint8_t>(1u << (((dx > 0) ? 2 : 0) | ((dy > 0) ? 1 : 0)));
}

inline bool is_odd(int v) { return (v & 1) != 0; }
}  // namespace

const char* collision_name(CollisionModel model) {
    switch (model) {
    case CollisionModel::Wall:   return "wall";
    case CollisionModel::Center: return "center";
    }
    return "unknown";
}

// ============================================================================
// Trajectory
// ============================================================================

Trajectory::Trajectory(int lattice_width, int lattice_height)
    : width_(lattice_width)
    , height_(lattice_height)
    , mask_(static_cast<size_t>(lattice_width) * static_cast<size_t>(lattice_height), 0) {}

bool Trajectory::add(const Point& p) {
    if (p.x < 0 || p.x >= width_ || p.y < 0 || p.y >= height_) {
        return false;
    }
    auto& m = mask_[static_cast<size_t>(p.y) * static_cast<size_t>(width_) +
                    static_cast<size_t>(p.x)];
    if (m) {
        return false;
    }
    m = 1;
    points_.push_back(p);
    return true;
}

bool Trajectory::contains(const Point& p) const {
    if (p.x < 0 || p.x >= width_ || p.y < 0 || p.y >= height_) {
        return false;
    }
    return mask_[static_cast<size_t>(p.y) * static_cast<size_t>(width_) +
                 static_cast<size_t>(p.x)] != 0;
}

void Trajectory::merge(const Trajectory& other) {
    if (mask_.empty()) {
        width_ = other.width_;
        height_ = other.height_;
        mask_.assign(other.mask_.size(), 0);
    }
    for (const auto& p : other.points_) {
        add(p);
    }
    stats_.rays_spawned += other.stats_.rays_spawned;
    stats_.rays_absorbed += other.stats_.rays_absorbed;
    stats_.rays_cycled += other.stats_.rays_cycled;
    stats_.steps += other.stats_.steps;
    stats_.peak_active = std::max(stats_.peak_active, other.stats_.peak_active);
}

// ============================================================================
// RayTracer
// ============================================================================

RayTracer::RayTracer(const Board& board, CollisionModel model)
    : board_(&board)
    , model_(model)
    , state_epoch_(board.lattice_size(), 0)
    , state_bits_(board.lattice_size(), 0)
    , point_epoch_(board.lattice_size(), 0) {}

RayTracer::Crossing RayTracer::wall_crossing(const RayState& ray) const {
    Crossing c;
    // 偶数座標は格子線上: 移動でその線を越えて隣の列（行）へ入る
    bool cross_v = !is_odd(ray.pos.x);
    bool cross_h = !is_odd(ray.pos.y);
    if (!cross_v && !cross_h) {
        return c;  // セル中心からは同じセル内を移動するだけ
    }

    int col = cross_v ? (ray.dx > 0 ? ray.pos.x / 2 : ray.pos.x / 2 - 1) : (ray.pos.x - 1) / 2;
    int row = cross_h ? (ray.dy > 0 ? ray.pos.y / 2 : ray.pos.y / 2 - 1) : (ray.pos.y - 1) / 2;

    bool col_out = col < 0 || col >= board_->width();
    bool row_out = row < 0 || row >= board_->height();
    if (col_out || row_out) {
        c.kind = Crossing::Kind::Border;
        c.flip_x = cross_v && col_out;
        c.flip_y = cross_h && row_out;
        return c;
    }

    c.kind = Crossing::Kind::Block;
    c.cell = {row, col};
    // 角を越える場合は両成分を反転
    c.flip_x = cross_v;
    c.flip_y = cross_h;
    return c;
}

RayTracer::Crossing RayTracer::center_crossing(const RayState& ray) const {
    Crossing c;
    Point center{is_odd(ray.pos.x) ? ray.pos.x : ray.pos.x + ray.dx,
                 is_odd(ray.pos.y) ? ray.pos.y : ray.pos.y + ray.dy};
    if (center == ray.pos) {
        return c;
    }

    bool x_out = center.x < 1 || center.x > 2 * board_->width() - 1;
    bool y_out = center.y < 1 || center.y > 2 * board_->height() - 1;
    if (x_out || y_out) {
        c.kind = Crossing::Kind::Border;
        c.flip_x = x_out;
        c.flip_y = y_out;
        return c;
    }

    c.kind = Crossing::Kind::Block;
    c.cell = {(center.y - 1) / 2, (center.x - 1) / 2};
    // 中心とのずれがある軸の辺に当たる
    c.flip_x = center.x != ray.pos.x;
    c.flip_y = center.y != ray.pos.y;
    return c;
}

void RayTracer::run(const Placement& config, const Laser& laser, Trajectory* out,
                    TraceStats& stats) {
    if (++current_state_epoch_ == 0) {
        std::fill(state_epoch_.begin(), state_epoch_.end(), 0);
        current_state_epoch_ = 1;
    }

    active_.clear();
    active_.push_back({laser.origin, laser.dx, laser.dy});
    stats.rays_spawned++;
    stats.peak_active = std::max(stats.peak_active, active_.size());

    while (!active_.empty()) {
        RayState ray = active_.back();
        active_.pop_back();

        while (true) {
            size_t idx = board_->lattice_index(ray.pos);
            if (state_epoch_[idx] != current_state_epoch_) {
                state_epoch_[idx] = current_state_epoch_;
                state_bits_[idx] = 0;
            }
            uint8_t bit = direction_bit(ray.dx, ray.dy);
            if (state_bits_[idx] & bit) {
                stats.rays_cycled++;
                break;
            }
            state_bits_[idx] |= bit;
            stats.steps++;

            point_epoch_[idx] = current_point_epoch_;
            if (out) {
                out->add(ray.pos);
            }

            Crossing c = (model_ == CollisionModel::Wall) ? wall_crossing(ray)
                                                          : center_crossing(ray);
            bool absorbed = false;
            bool advance = true;

            if (c.kind == Crossing::Kind::Border) {
                // 外周は反射面
                if (c.flip_x) ray.dx = -ray.dx;
                if (c.flip_y) ray.dy = -ray.dy;
                advance = false;
            } else if (c.kind == Crossing::Kind::Block) {
                auto block = config.block_at(c.cell);
                if (block) {
                    switch (*block) {
                    case BlockType::Opaque:
                        absorbed = true;
                        break;
                    case BlockType::Reflect:
                        if (c.flip_x) ray.dx = -ray.dx;
                        if (c.flip_y) ray.dy = -ray.dy;
                        advance = false;
                        break;
                    case BlockType::Refract: {
                        RayState fork = ray;
                        if (c.flip_x) fork.dx = -fork.dx;
                        if (c.flip_y) fork.dy = -fork.dy;
                        active_.push_back(fork);
                        stats.rays_spawned++;
                        stats.peak_active = std::max(stats.peak_active, active_.size() + 1);
                        break;
                    }
                    }
                }
            }

            if (absorbed) {
                stats.rays_absorbed++;
                break;
            }
            if (advance) {
                ray.pos.x += ray.dx;
                ray.pos.y += ray.dy;
            }
        }
    }
}

void RayTracer::next_point_epoch() {
    if (++current_point_epoch_ == 0) {
        std::fill(point_epoch_.begin(), point_epoch_.end(), 0);
        current_point_epoch_ = 1;
    }
}

Trajectory RayTracer::trace(const Placement& config, const Laser& laser) {
    Trajectory out(board_->lattice_width(), board_->lattice_height());
    next_point_epoch();
    run(config, laser, &out, out.stats());
    return out;
}

Trajectory RayTracer::trace_all(const Placement& config) {
    Trajectory out(board_->lattice_width(), board_->lattice_height());
    next_point_epoch();
    for (const auto& laser : board_->lasers()) {
        run(config, laser, &out, out.stats());
    }
    return out;
}

size_t RayTracer::count_hits(const Placement& config, std::vector<bool>& hits) {
    next_point_epoch();
    TraceStats stats;
    for (const auto& laser : board_->lasers()) {
        run(config, laser, nullptr, stats);
    }

    const auto& targets = board_->targets();
    hits.assign(targets.size(), false);
    size_t count = 0;
    for (size_t i = 0; i < targets.size(); ++i) {
        if (point_epoch_[board_->lattice_index(targets[i])] == current_point_epoch_) {
            hits[i] = true;
            count++;
        }
    }
    return count;
}

bool RayTracer::visited(const Point& p) const {
    if (!board_->in_lattice(p)) {
        return false;
    }
    return point_epoch_[board_->lattice_index(p)] == current_point_epoch_;
}

Trajectory trace(const Placement& config, const Laser& laser, CollisionModel model) {
    RayTracer tracer(config.board(), model);
    return tracer.trace(config, laser);
}

std::vector<bool> evaluate(const Placement& config, CollisionModel model) {
    RayTracer tracer(config.board(), model);
    std::vector<bool> hits;
    tracer.count_hits(config, hits);
    return hits;
}

} // namespace lazor
