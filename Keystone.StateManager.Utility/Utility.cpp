#include "Utility.h"

int ReportFailure(
    const FailedResult& failedResult)
{
    cerr << failedResult.ErrorCode.message() << ": " << failedResult.Message << "\n";
    return 1;
}
