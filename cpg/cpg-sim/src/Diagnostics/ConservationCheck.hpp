// Ticket: 0004_conservation_diagnostics

#ifndef CPG_SIM_DIAGNOSTICS_CONSERVATION_CHECK_HPP
#define CPG_SIM_DIAGNOSTICS_CONSERVATION_CHECK_HPP

#include <Eigen/Dense>

namespace cpg_sim
{

struct CollisionEvent;

/**
 * @brief Momentum and kinetic energy bookkeeping for the two-body system
 *
 * The two bodies are treated as a 2-vector system: masses m = (m_A, m_B) and
 * velocities v = (v_A, v_B), so that
 *
 *   p  = m . v
 *   KE = 0.5 * m . (v o v)
 *
 * Used post hoc: the simulator logs the report, tests assert on it. Nothing
 * here throws on a violation.
 *
 * @ticket 0004_conservation_diagnostics
 */
class ConservationCheck
{
public:
  /**
   * @brief Pre/post collision totals
   */
  struct Report
  {
    double momentumBefore{0.0};  // [kg*m/s]
    double momentumAfter{0.0};   // [kg*m/s]
    double energyBefore{0.0};    // [J]
    double energyAfter{0.0};     // [J]

    /**
     * @brief |p_after - p_before| / |p_before|, or the absolute error when
     * the system has (near) zero momentum
     */
    [[nodiscard]] double relativeMomentumError() const;

    /**
     * @brief |KE_after - KE_before| / KE_before
     */
    [[nodiscard]] double relativeEnergyError() const;

    /**
     * @brief Whether both quantities are conserved within tolerance
     *
     * Uses the larger of relative and absolute tolerance for each quantity,
     * matching isConserved().
     */
    [[nodiscard]] bool withinTolerance(double relativeTolerance = 1e-6,
                                       double absoluteTolerance = 1e-9) const;
  };

  /**
   * @brief Total linear momentum
   * @param masses (m_A, m_B) [kg]
   * @param velocities (v_A, v_B) [m/s]
   * @return m . v [kg*m/s]
   */
  static double momentum(const Eigen::Vector2d& masses,
                         const Eigen::Vector2d& velocities);

  /**
   * @brief Total kinetic energy
   * @param masses (m_A, m_B) [kg]
   * @param velocities (v_A, v_B) [m/s]
   * @return 0.5 * sum(m_i * v_i^2) [J]
   */
  static double kineticEnergy(const Eigen::Vector2d& masses,
                              const Eigen::Vector2d& velocities);

  /**
   * @brief Build the pre/post report for a collision event
   * @param event Collision with before/after velocities
   * @param massA Mass of A [kg]
   * @param massB Mass of B [kg]
   */
  static Report compare(const CollisionEvent& event, double massA, double massB);

  /**
   * @brief Check whether a conserved quantity stayed within tolerance
   *
   * threshold = max(relativeTolerance * |before|, absoluteTolerance)
   *
   * @return true if |after - before| <= threshold
   */
  static bool isConserved(double before,
                          double after,
                          double relativeTolerance = 1e-6,
                          double absoluteTolerance = 1e-9);
};

}  // namespace cpg_sim

#endif  // CPG_SIM_DIAGNOSTICS_CONSERVATION_CHECK_HPP
