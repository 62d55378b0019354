// PyBind11 bindings for the uavrl C++ core.
// Exposes the grid environment, the learners and the trainer so that a
// Python front-end (rendering, interactive control) can drive them.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "env/state.hpp"
#include "env/grid_config.hpp"
#include "env/grid_state.hpp"
#include "env/uav_grid_env.hpp"
#include "learning/exploration.hpp"
#include "learning/learner.hpp"
#include "learning/sarsa_learner.hpp"
#include "learning/q_learner.hpp"
#include "learning/random_learner.hpp"
#include "memory/episode_log.hpp"
#include "training/trainer.hpp"

#include <iostream>

namespace py = pybind11;

PYBIND11_MODULE(uavrl_bindings, m) {
    m.doc() = "UAV trajectory learning core bindings";

    py::enum_<uavrl::Action>(m, "Action")
        .value("UP", uavrl::UP)
        .value("DOWN", uavrl::DOWN)
        .value("LEFT", uavrl::LEFT)
        .value("RIGHT", uavrl::RIGHT);
    m.attr("NUM_ACTIONS") = uavrl::NUM_ACTIONS;

    // ── Configuration ──
    py::class_<uavrl::CellPos>(m, "CellPos")
        .def(py::init<>())
        .def(py::init([](int col, int row) { return uavrl::CellPos{col, row}; }))
        .def_readwrite("col", &uavrl::CellPos::col)
        .def_readwrite("row", &uavrl::CellPos::row)
        .def("__eq__", &uavrl::CellPos::operator==);

    py::class_<uavrl::ReceiverSite>(m, "ReceiverSite")
        .def(py::init<>())
        .def(py::init([](double col, double row) { return uavrl::ReceiverSite{col, row}; }))
        .def_readwrite("col", &uavrl::ReceiverSite::col)
        .def_readwrite("row", &uavrl::ReceiverSite::row);

    py::class_<uavrl::ChannelParams>(m, "ChannelParams")
        .def(py::init<>())
        .def_readwrite("map_width_px", &uavrl::ChannelParams::map_width_px)
        .def_readwrite("map_height_px", &uavrl::ChannelParams::map_height_px)
        .def_readwrite("altitude_px", &uavrl::ChannelParams::altitude_px)
        .def_readwrite("meter_per_pixel", &uavrl::ChannelParams::meter_per_pixel)
        .def_readwrite("path_loss_exponent", &uavrl::ChannelParams::path_loss_exponent)
        .def_readwrite("beta_los", &uavrl::ChannelParams::beta_los)
        .def_readwrite("beta_nlos", &uavrl::ChannelParams::beta_nlos)
        .def_readwrite("noise_dbm", &uavrl::ChannelParams::noise_dbm)
        .def_readwrite("tx_power_dbm", &uavrl::ChannelParams::tx_power_dbm);

    py::class_<uavrl::GridConfig>(m, "GridConfig")
        .def(py::init<>())
        .def_readwrite("cols", &uavrl::GridConfig::cols)
        .def_readwrite("rows", &uavrl::GridConfig::rows)
        .def_readwrite("obstacles", &uavrl::GridConfig::obstacles)
        .def_readwrite("start", &uavrl::GridConfig::start)
        .def_readwrite("end", &uavrl::GridConfig::end)
        .def_readwrite("flight_time", &uavrl::GridConfig::flight_time)
        .def_readwrite("receivers", &uavrl::GridConfig::receivers)
        .def_readwrite("channel", &uavrl::GridConfig::channel)
        .def("validate", &uavrl::GridConfig::validate);

    m.def("obstacle_block", &uavrl::obstacleBlock,
          py::arg("col_first"), py::arg("col_last"),
          py::arg("row_first"), py::arg("row_last"));

    // ── States & environment ──
    py::class_<uavrl::State, std::shared_ptr<uavrl::State>>(m, "State")
        .def("valid_actions", &uavrl::State::validActions)
        .def("key", &uavrl::State::key)
        .def("__str__", &uavrl::State::key);

    py::class_<uavrl::GridState, uavrl::State, std::shared_ptr<uavrl::GridState>>(m, "GridState")
        .def_property_readonly("col", &uavrl::GridState::col)
        .def_property_readonly("row", &uavrl::GridState::row)
        .def_property_readonly("step", &uavrl::GridState::step);

    py::class_<uavrl::EnvInfo>(m, "EnvInfo")
        .def_readonly("description", &uavrl::EnvInfo::description)
        .def_readonly("flight_time", &uavrl::EnvInfo::flight_time);

    py::class_<uavrl::StepResult>(m, "StepResult")
        .def_readonly("state", &uavrl::StepResult::state)
        .def_readonly("reward", &uavrl::StepResult::reward)
        .def_readonly("terminated", &uavrl::StepResult::terminated)
        .def_readonly("truncated", &uavrl::StepResult::truncated);

    py::class_<uavrl::UavGridEnv>(m, "UavGridEnv")
        .def(py::init<uavrl::GridConfig>(), py::arg("config") = uavrl::GridConfig{})
        .def("reset", [](uavrl::UavGridEnv& self) {
            uavrl::ResetResult r = self.reset();
            return py::make_tuple(r.state, *r.info);
        })
        .def("step", [](uavrl::UavGridEnv& self, int action) {
            uavrl::StepResult r = self.step(action);
            return py::make_tuple(r.state, r.reward, r.terminated, r.truncated, *r.info);
        }, py::arg("action"))
        .def("info", &uavrl::UavGridEnv::info)
        .def("elapsed_steps", &uavrl::UavGridEnv::elapsedSteps)
        .def("num_actions", &uavrl::UavGridEnv::numActions)
        .def("position", &uavrl::UavGridEnv::position)
        .def("rate", [](const uavrl::UavGridEnv& self, size_t receiver, int col, int row) {
            return self.world().rates().rate(receiver, col, row);
        })
        .def("blockage", [](const uavrl::UavGridEnv& self, int col, int row) {
            return self.world().rates().blockage(col, row);
        })
        .def("fair_rate", [](const uavrl::UavGridEnv& self, int col, int row) {
            return self.world().fairRate(col, row);
        });

    // ── Learners ──
    py::class_<uavrl::ExplorationConfig>(m, "ExplorationConfig")
        .def(py::init<>())
        .def_readwrite("initial", &uavrl::ExplorationConfig::initial)
        .def_readwrite("factor", &uavrl::ExplorationConfig::factor)
        .def_readwrite("floor", &uavrl::ExplorationConfig::floor)
        .def("set_mode", [](uavrl::ExplorationConfig& self, const std::string& mode) {
            self.mode = uavrl::parseDecayMode(mode);
        });

    py::class_<uavrl::TabularConfig>(m, "TabularConfig")
        .def(py::init<>())
        .def_readwrite("alpha", &uavrl::TabularConfig::alpha)
        .def_readwrite("gamma", &uavrl::TabularConfig::gamma)
        .def_readwrite("exploration", &uavrl::TabularConfig::exploration)
        .def_readwrite("seed", &uavrl::TabularConfig::seed)
        .def_readwrite("snapshot_dir", &uavrl::TabularConfig::snapshot_dir);

    py::class_<uavrl::Learner>(m, "Learner")
        .def_property_readonly("name", &uavrl::Learner::name)
        .def("get_action", &uavrl::Learner::getAction,
             py::arg("state"), py::arg("reward") = py::none())
        .def("set_exploration", &uavrl::Learner::setExploration)
        .def("exploration_value", &uavrl::Learner::explorationValue)
        .def("load_data", &uavrl::Learner::loadData)
        .def("save_data", &uavrl::Learner::saveData, py::arg("round"));

    py::class_<uavrl::TabularLearner, uavrl::Learner>(m, "TabularLearner")
        .def("load_from", &uavrl::TabularLearner::loadFrom)
        .def("last_snapshot_path", &uavrl::TabularLearner::lastSnapshotPath)
        .def("q", [](uavrl::TabularLearner& self, const std::string& key) {
            return self.table().get(key);
        })
        .def("table_size", [](const uavrl::TabularLearner& self) {
            return self.table().size();
        });

    py::class_<uavrl::SarsaLearner, uavrl::TabularLearner>(m, "SarsaLearner")
        .def(py::init<size_t, bool, uavrl::TabularConfig>(),
             py::arg("num_actions"), py::arg("exploration") = true,
             py::arg("config") = uavrl::TabularConfig{});

    py::class_<uavrl::QLearner, uavrl::TabularLearner>(m, "QLearner")
        .def(py::init<size_t, bool, uavrl::TabularConfig>(),
             py::arg("num_actions"), py::arg("exploration") = true,
             py::arg("config") = uavrl::TabularConfig{});

    py::class_<uavrl::RandomLearner, uavrl::Learner>(m, "RandomLearner")
        .def(py::init<std::optional<uint32_t>>(), py::arg("seed") = py::none());

    // ── Training ──
    py::class_<uavrl::EpisodeRecord>(m, "EpisodeRecord")
        .def_readonly("episode", &uavrl::EpisodeRecord::episode)
        .def_readonly("reward", &uavrl::EpisodeRecord::reward)
        .def_readonly("terminated", &uavrl::EpisodeRecord::terminated)
        .def_readonly("flight_time", &uavrl::EpisodeRecord::flight_time);

    py::class_<uavrl::TrainerConfig>(m, "TrainerConfig")
        .def(py::init<>())
        .def_readwrite("max_episodes", &uavrl::TrainerConfig::max_episodes)
        .def_readwrite("load_data", &uavrl::TrainerConfig::load_data)
        .def_readwrite("save_data", &uavrl::TrainerConfig::save_data)
        .def_readwrite("exploration", &uavrl::TrainerConfig::exploration)
        .def_readwrite("sample", &uavrl::TrainerConfig::sample)
        .def_readwrite("sample_interval", &uavrl::TrainerConfig::sample_interval)
        .def_readwrite("summary_window", &uavrl::TrainerConfig::summary_window);

    py::class_<uavrl::EvaluationResult>(m, "EvaluationResult")
        .def_readonly("episode", &uavrl::EvaluationResult::episode)
        .def_readonly("reward", &uavrl::EvaluationResult::reward)
        .def_readonly("exploration", &uavrl::EvaluationResult::exploration)
        .def_readonly("flight_time", &uavrl::EvaluationResult::flight_time)
        .def_readonly("terminated", &uavrl::EvaluationResult::terminated);

    py::class_<uavrl::TrainingSummary>(m, "TrainingSummary")
        .def_readonly("first_episode", &uavrl::TrainingSummary::first_episode)
        .def_readonly("last_episode", &uavrl::TrainingSummary::last_episode)
        .def_readonly("episodes_run", &uavrl::TrainingSummary::episodes_run)
        .def_readonly("interrupted", &uavrl::TrainingSummary::interrupted)
        .def_readonly("saved", &uavrl::TrainingSummary::saved)
        .def_readonly("evaluations", &uavrl::TrainingSummary::evaluations);

    py::class_<uavrl::Trainer>(m, "Trainer")
        .def(py::init([](uavrl::UavGridEnv& env, uavrl::Learner& learner,
                         const uavrl::TrainerConfig& config) {
                 return new uavrl::Trainer(env, learner, config, std::cout);
             }),
             py::arg("env"), py::arg("learner"), py::arg("config") = uavrl::TrainerConfig{},
             py::keep_alive<1, 2>(), py::keep_alive<1, 3>())
        .def("run", [](uavrl::Trainer& self) { return self.run(); })
        .def("evaluate", &uavrl::Trainer::evaluate, py::arg("episode"))
        .def("episodes", [](const uavrl::Trainer& self) { return self.episodes().all(); });
}
