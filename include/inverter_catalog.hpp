#ifndef INVERTER_CATALOG_H
#define INVERTER_CATALOG_H

#include "register_table.hpp"
#include <memory>

/**
 * @brief Register map of Huawei SUN2000 string inverters.
 *
 * Covers device identification, PV string and grid measurements, state and
 * alarm bitfields, yield counters, the device clock and the writable power
 * control registers. The table is built once and shared.
 */
std::shared_ptr<const RegisterTable> huaweiSun2000Registers();

#endif // INVERTER_CATALOG_H
