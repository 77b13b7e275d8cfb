#ifndef INSTRUMENT_BENCH_EXPORT_H
#define INSTRUMENT_BENCH_EXPORT_H

#ifdef _WIN32
#ifdef instrument_bench_core_EXPORTS
#define INSTRUMENT_BENCH_API __declspec(dllexport)
#else
#define INSTRUMENT_BENCH_API __declspec(dllimport)
#endif
#else
#define INSTRUMENT_BENCH_API
#endif

#endif // INSTRUMENT_BENCH_EXPORT_H
