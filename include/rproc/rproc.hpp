/*
 * rproc.hpp
 *
 *  Created on: Oct 5, 2026
 *      Author: rproc contributors
 */

#ifndef INCLUDE_RPROC_RPROC_HPP_
#define INCLUDE_RPROC_RPROC_HPP_

#include <limits>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <string>

#ifdef _MSC_VER
#define R_DLL_EXPORT __declspec(dllexport)
#else
#define R_DLL_EXPORT
#endif

constexpr int R_LOG_TRACE = 5;
constexpr int R_LOG_DEBUG = 4;
constexpr int R_LOG_WARN = 3;
constexpr int R_LOG_ERROR = 2;
constexpr int R_LOG_NONE = 0;

namespace rproc {

	/**
	 * \brief Return the current log level. Messages at or below this level are printed.
	 */
	R_DLL_EXPORT int loglevel();

	/**
	 * \brief Set the log level.
	 *
	 * \param x One of the R_LOG_* constants.
	 */
	R_DLL_EXPORT void loglevel(int x);

	template <class T>
	T maxvalue() {
		return std::numeric_limits<T>::max();
	}

	template <class T>
	T lowest() {
		return std::numeric_limits<T>::lowest();
	}

	template <class T>
	inline T min(T a, T b) {
		return a > b ? b : a;
	}

	template <class T>
	inline T max(T a, T b) {
		return a < b ? b : a;
	}

	template <class T>
	inline T sq(T a) {
		return a * a;
	}

	/**
	 * Receives status updates from a running operation.
	 *
	 * The default implementation prints the status to stdout. Subclasses
	 * can redirect it, e.g. to a progress bar.
	 */
	class R_DLL_EXPORT Monitor {
	protected:
		float m_start;
		float m_end;
		float m_lastStatus;

	public:

		Monitor() :
			m_start(0),
			m_end(1),
			m_lastStatus(0) {}

		/**
		 * \brief Set the progress range to {start} to {end}.
		 *
		 * The status is transformed by status = start + status * (end - start).
		 *
		 * \param start The starting status.
		 * \param end The ending status.
		 */
		void init(float start, float end) {
			m_start = start;
			m_end = end;
			m_lastStatus = start;
		}

		/**
		 * \brief Report the status.
		 *
		 * \param status A value between 0 and 1. If negative, the last status is repeated.
		 * \param message An optional message.
		 */
		virtual void status(float status, const std::string& message = "") {
			if(status < 0)
				status = m_lastStatus;
			m_lastStatus = status;
			std::cout << std::setprecision(1) << std::fixed << message << " " << (m_start + status * (m_end - m_start)) * 100.0f << "%\n";
		}

		virtual void error(const std::string& err) {
			std::cerr << err << "\n";
		}

		virtual ~Monitor() {}
	};

	/**
	 * \brief Return a pointer to the process-wide default monitor.
	 */
	R_DLL_EXPORT Monitor* getDefaultMonitor();

} // rproc


#define r_log(x, y) { if(rproc::loglevel() >= y) std::cerr << std::setprecision(12) << x << std::endl; }

#define r_trace(x) r_log("TRACE  : " << x, R_LOG_TRACE)
#define r_debug(x) r_log("DEBUG  : " << x, R_LOG_DEBUG)
#define r_warn(x)  r_log("WARNING: " << x, R_LOG_WARN)
#define r_error(x) r_log("ERROR  : " << x, R_LOG_ERROR)

#define r_argerr(x) {std::stringstream _ss; _ss << x; throw std::invalid_argument(_ss.str());}
#define r_runerr(x) {std::stringstream _ss; _ss << x; throw std::runtime_error(_ss.str());}

#endif /* INCLUDE_RPROC_RPROC_HPP_ */
