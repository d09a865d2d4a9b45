#ifndef CPG_TRANSFER_RECORDS_HPP
#define CPG_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all dataset transfer objects
 */

#include "cpg-transfer/src/SampleRecord.hpp"
#include "cpg-transfer/src/TrajectoryStateRecord.hpp"

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

namespace cpg_transfer
{

/**
 * @brief Type alias for cpp_sqlite Database
 */
using Database = cpp_sqlite::Database;

}  // namespace cpg_transfer

#endif  // CPG_TRANSFER_RECORDS_HPP
