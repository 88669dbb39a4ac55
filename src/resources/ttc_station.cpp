/**
 * @file ttc_station.cpp
 * @brief Station antenna lookups and the built-in station network.
 * @author ConstellationPlanner contributors
 */

#include "resources/ttc_station.hpp"

#include <algorithm>

namespace constellation_planner {

namespace {

Antenna make_antenna(StationId station, std::string suffix, std::string name,
                     double rate_mbps, std::vector<std::string> bands, double switch_sec) {
    return Antenna{
        .id = station + "_" + suffix,
        .name = std::move(name),
        .station_id = station,
        .max_data_rate_mbps = rate_mbps,
        .supported_frequencies = std::move(bands),
        .available_windows = std::nullopt,
        .satellite_switch_time_sec = switch_sec,
    };
}

}  // anonymous namespace

const Antenna* TtcStation::find_antenna(std::string_view antenna_id) const {
    auto it = std::find_if(antennas.begin(), antennas.end(),
                           [antenna_id](const Antenna& a) { return a.id == antenna_id; });
    return it != antennas.end() ? &*it : nullptr;
}

std::vector<const Antenna*> TtcStation::antennas_available_at(Timestamp t) const {
    std::vector<const Antenna*> out;
    for (const auto& a : antennas) {
        if (a.is_available_at(t)) out.push_back(&a);
    }
    return out;
}

std::vector<const Antenna*> TtcStation::antennas_available_during(const TimeWindow& window) const {
    std::vector<const Antenna*> out;
    for (const auto& a : antennas) {
        if (a.is_available_during(window)) out.push_back(&a);
    }
    return out;
}

std::vector<const Antenna*> TtcStation::antennas_by_frequency(std::string_view band) const {
    std::vector<const Antenna*> out;
    for (const auto& a : antennas) {
        if (a.supports_frequency(band)) out.push_back(&a);
    }
    return out;
}

double TtcStation::max_data_rate_mbps() const noexcept {
    double best = 0.0;
    for (const auto& a : antennas) best = std::max(best, a.max_data_rate_mbps);
    return best;
}

std::vector<TtcStation> default_ttc_stations() {
    std::vector<TtcStation> stations;

    TtcStation beijing{.id = "BJGS", .name = "Beijing TT&C Station",
                       .latitude_deg = 40.0, .longitude_deg = 116.4, .altitude_m = 50.0};
    beijing.antennas = {
        make_antenna("BJGS", "ANT01", "Beijing antenna 1", 1200.0, {"X", "Ka"}, 5.0),
        make_antenna("BJGS", "ANT02", "Beijing antenna 2", 800.0, {"X"}, 4.0),
    };
    stations.push_back(std::move(beijing));

    TtcStation kashgar{.id = "KSGS", .name = "Kashgar TT&C Station",
                       .latitude_deg = 39.5, .longitude_deg = 76.0, .altitude_m = 1300.0};
    kashgar.antennas = {
        make_antenna("KSGS", "ANT01", "Kashgar antenna 1", 1000.0, {"X", "Ka"}, 5.0),
        make_antenna("KSGS", "ANT02", "Kashgar antenna 2", 600.0, {"X"}, 4.0),
    };
    stations.push_back(std::move(kashgar));

    TtcStation sanya{.id = "SYGS", .name = "Sanya TT&C Station",
                     .latitude_deg = 18.2, .longitude_deg = 109.5, .altitude_m = 10.0};
    sanya.uplink_rate_kbps = 128.0;
    sanya.antennas = {
        make_antenna("SYGS", "ANT01", "Sanya antenna 1", 1500.0, {"X", "Ka", "S"}, 5.0),
    };
    stations.push_back(std::move(sanya));

    TtcStation jiamusi{.id = "JMSGS", .name = "Jiamusi TT&C Station",
                       .latitude_deg = 46.8, .longitude_deg = 130.3, .altitude_m = 80.0};
    jiamusi.antennas = {
        make_antenna("JMSGS", "ANT01", "Jiamusi antenna 1", 800.0, {"X"}, 4.0),
    };
    stations.push_back(std::move(jiamusi));

    return stations;
}

std::vector<TtcStation> ttc_stations_from_config(const std::vector<StationConfig>& configs) {
    if (configs.empty()) return default_ttc_stations();

    std::vector<TtcStation> stations;
    stations.reserve(configs.size());
    for (const auto& cfg : configs) {
        TtcStation st{
            .id = cfg.id,
            .name = cfg.name,
            .latitude_deg = cfg.latitude_deg,
            .longitude_deg = cfg.longitude_deg,
            .altitude_m = cfg.altitude_m,
            .antennas = {},
            .min_elevation_deg = cfg.min_elevation_deg,
            .uplink_rate_kbps = cfg.uplink_rate_kbps,
            .base_uplink_time_sec = cfg.base_uplink_time_sec,
            .per_task_uplink_time_sec = cfg.per_task_uplink_time_sec,
            .inter_antenna_switch_time_sec = cfg.inter_antenna_switch_time_sec,
        };
        for (const auto& ant : cfg.antennas) {
            st.antennas.push_back(Antenna{
                .id = ant.id,
                .name = ant.name,
                .station_id = cfg.id,
                .max_data_rate_mbps = ant.max_data_rate_mbps,
                .supported_frequencies = ant.frequency_bands,
                .available_windows = std::nullopt,
                .satellite_switch_time_sec = ant.satellite_switch_time_sec,
            });
        }
        stations.push_back(std::move(st));
    }
    return stations;
}

}  // namespace constellation_planner
