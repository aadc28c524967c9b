/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * StratisId Core C API.
 */

#include "SID.h"
#include "../sidcore/Context.hpp"
#include "../sidcore/login/SignatureAuth.hpp"
#include "../sidcore/login/StratisId.hpp"
#include "../sidcore/util/Debug.hpp"
#include "../sidcore/util/FileIO.hpp"
#include "../sidcore/util/Util.hpp"
#include <stdlib.h>
#include <memory>
#include <new>

using namespace sidcore;

#define SID_PROLOG() \
    SID_DebugLog("%s called", __FUNCTION__); \
    tSID_CC cc = SID_CC_Ok; \
    SID_SET_ERR_CODE(pError, SID_CC_Ok); \
    SID_CHECK_ASSERT(gContext, SID_CC_NotInitialized, "The core library has not been initalized")

tSID_CC SID_Initialize(const char *szRootDir,
                       tSID_Error *pError)
{
    // Cannot use SID_PROLOG - different initialization semantics
    SID_DebugLog("%s called", __FUNCTION__);
    tSID_CC cc = SID_CC_Ok;
    SID_SET_ERR_CODE(pError, SID_CC_Ok);
    SID_CHECK_ASSERT(!gContext, SID_CC_Reinitialization,
                     "The core library has already been initalized");
    SID_CHECK_NULL(szRootDir);

    {
        // Initialize the global context object:
        gContext.reset(new Context(szRootDir));
        SID_CHECK_NEW(fileEnsureDir(gContext->rootDir()), pError);

        // initialize logging
        SID_CHECK_NEW(debugInitialize(), pError);
    }

exit:
    if (SID_CC_Ok != cc)
        gContext.reset();
    return cc;
}

/**
 * Mark the end of use of the StratisId Core library.
 *
 * This function is the counter to SID_Initialize.
 * It should be called when all use of the library is complete.
 */
void SID_Terminate()
{
    // Cannot use SID_PROLOG - no pError
    if (gContext)
    {
        gContext.reset();
        debugTerminate();
    }
}

void SID_Log(const char *szMessage)
{
    SID_DebugLog("%s", szMessage);
}

tSID_CC SID_CreateStratisId(const char *szCallbackPath,
                            const char *szUid,
                            bool bHasExpiry,
                            int64_t expiry,
                            const char *szRedirectUri,
                            tSID_StratisIdForm form,
                            char **pszText,
                            tSID_Error *pError)
{
    SID_PROLOG();
    SID_CHECK_NULL(szCallbackPath);
    SID_CHECK_NULL(szUid);
    SID_CHECK_NULL(pszText);

    {
        const std::string redirectUri = szRedirectUri ? szRedirectUri : "";
        SID_CHECK_NEW(stratisIdCheck(szCallbackPath, szUid, redirectUri), pError);

        std::unique_ptr<StratisId> id;
        if (bHasExpiry)
            id.reset(new StratisId(szCallbackPath, szUid, expiry, redirectUri));
        else
            id.reset(new StratisId(szCallbackPath, szUid, redirectUri));

        switch (form)
        {
        case SID_StratisIdForm_Callback:
            *pszText = stringCopy(id->encode());
            break;
        case SID_StratisIdForm_Uri:
            *pszText = stringCopy(id->encodeUri());
            break;
        case SID_StratisIdForm_Protocol:
            *pszText = stringCopy(id->encodeProtocol());
            break;
        default:
            SID_RET_ERROR(SID_CC_InvalidArgument, "Unknown StratisId form");
        }
    }

exit:
    return cc;
}

tSID_CC SID_ParseStratisId(const char *szText,
                           tSID_StratisIdInfo **ppInfo,
                           tSID_Error *pError)
{
    SID_PROLOG();
    SID_CHECK_NULL(szText);
    SID_CHECK_NULL(ppInfo);

    {
        std::unique_ptr<StratisId> id;
        SID_CHECK_NEW(stratisIdParse(id, szText).log(), pError);

        auto info = static_cast<tSID_StratisIdInfo *>(
            calloc(1, sizeof(tSID_StratisIdInfo)));
        if (!info)
            throw std::bad_alloc();

        info->szCallbackPath = stringCopy(id->callbackPath());
        info->szUid = stringCopy(id->uid());
        info->szCallbackUrl = stringCopy(callbackUrl(*id));
        info->bHasExpiry = id->expiryOk();
        info->expiry = id->expiryOk() ? id->expiryUnix() : 0;
        info->szRedirectUri = id->redirectOk() ?
                              stringCopy(id->redirectUri()) : nullptr;
        *ppInfo = info;
    }

exit:
    return cc;
}

void SID_FreeStratisIdInfo(tSID_StratisIdInfo *pInfo)
{
    if (pInfo)
    {
        free(pInfo->szCallbackPath);
        free(pInfo->szUid);
        free(pInfo->szCallbackUrl);
        free(pInfo->szRedirectUri);
        free(pInfo);
    }
}

tSID_CC SID_StratisIdExpired(const char *szText,
                             bool *pbExpired,
                             tSID_Error *pError)
{
    SID_PROLOG();
    SID_CHECK_NULL(szText);
    SID_CHECK_NULL(pbExpired);

    {
        std::unique_ptr<StratisId> id;
        SID_CHECK_NEW(stratisIdParse(id, szText).log(), pError);
        *pbExpired = id->expired();
    }

exit:
    return cc;
}

tSID_CC SID_CallbackBody(const char *szSignature,
                         const char *szPublicKey,
                         char **pszJson,
                         tSID_Error *pError)
{
    SID_PROLOG();
    SID_CHECK_NULL(szSignature);
    SID_CHECK_NULL(szPublicKey);
    SID_CHECK_NULL(pszJson);

    {
        CallbackBodyJson json;
        SID_CHECK_NEW(json.signatureSet(szSignature), pError);
        SID_CHECK_NEW(json.publicKeySet(szPublicKey), pError);
        *pszJson = stringCopy(json.encode(true));
    }

exit:
    return cc;
}
