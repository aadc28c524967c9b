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

#ifndef SID_h
#define SID_h

#include <stdbool.h>
#include <stdint.h>

#define SID_MAX_STRING_LENGTH 256

#ifdef __cplusplus
extern "C" {
#endif

/**
 * StratisId Core Condition Codes
 *
 * All StratisId Core functions return this code.
 * SID_CC_Ok indicates that there was no issue.
 * All other values indication some issue.
 */
typedef enum eSID_CC
{
    /** The function completed without an error */
    SID_CC_Ok = 0,
    /** An error occured */
    SID_CC_Error = 1,
    /** Unexpected NULL pointer */
    SID_CC_NULLPtr = 2,
    /** No such file */
    SID_CC_FileDoesNotExist = 3,
    /** JSON parsing error */
    SID_CC_JSONError = 4,
    /** System error */
    SID_CC_SysError = 5,
    /** The core library has not been initalized */
    SID_CC_NotInitialized = 6,
    /** Attempt to initialize the core library twice */
    SID_CC_Reinitialization = 7,
    /** The text is not a valid StratisId */
    SID_CC_ParseError = 8,
    /** A required StratisId part is missing or malformed */
    SID_CC_InvalidArgument = 9
} tSID_CC;

/**
 * Error structure
 *
 * This structure contains the detailed information associated
 * with an error.
 */
typedef struct sSID_Error
{
    /** The condition code code */
    tSID_CC code;
    /** String containing a description of the error */
    char szDescription[SID_MAX_STRING_LENGTH + 1];
    /** String containing the function in which the error occurred */
    char szSourceFunc[SID_MAX_STRING_LENGTH + 1];
    /** String containing the source file in which the error occurred */
    char szSourceFile[SID_MAX_STRING_LENGTH + 1];
    /** Line number in the source file in which the error occurred */
    int  nSourceLine;
} tSID_Error;

/**
 * The textual forms a StratisId can take.
 */
typedef enum eSID_StratisIdForm
{
    /** api.example.com/auth?uid=... */
    SID_StratisIdForm_Callback,
    /** sid:api.example.com/auth?uid=... */
    SID_StratisIdForm_Uri,
    /** web+sid:api.example.com/auth?uid=...&redirectScheme=... */
    SID_StratisIdForm_Protocol
} tSID_StratisIdForm;

/**
 * The parts of a parsed StratisId.
 * Free with SID_FreeStratisIdInfo.
 */
typedef struct sSID_StratisIdInfo
{
    /** Callback authority and path, without any scheme */
    char *szCallbackPath;
    /** Request identifier */
    char *szUid;
    /** Callback URL the signer sends its HTTPS request to */
    char *szCallbackUrl;
    /** True if the StratisId carries an expiry */
    bool bHasExpiry;
    /** Unix timestamp, valid if bHasExpiry is set */
    int64_t expiry;
    /** Full redirect URI, or NULL */
    char *szRedirectUri;
} tSID_StratisIdInfo;

tSID_CC SID_Initialize(const char *szRootDir,
                       tSID_Error *pError);

void SID_Terminate();

void SID_Log(const char *szMessage);

/**
 * Builds a StratisId from its parts and writes it in the requested form.
 * @param bHasExpiry set to false to leave out the expiry.
 * @param szRedirectUri may be NULL.
 * @param pszText receives the text. Free with free().
 */
tSID_CC SID_CreateStratisId(const char *szCallbackPath,
                            const char *szUid,
                            bool bHasExpiry,
                            int64_t expiry,
                            const char *szRedirectUri,
                            tSID_StratisIdForm form,
                            char **pszText,
                            tSID_Error *pError);

tSID_CC SID_ParseStratisId(const char *szText,
                           tSID_StratisIdInfo **ppInfo,
                           tSID_Error *pError);

void SID_FreeStratisIdInfo(tSID_StratisIdInfo *pInfo);

tSID_CC SID_StratisIdExpired(const char *szText,
                             bool *pbExpired,
                             tSID_Error *pError);

/**
 * Builds the JSON body a signer posts to the callback URL.
 * @param pszJson receives the JSON text. Free with free().
 */
tSID_CC SID_CallbackBody(const char *szSignature,
                         const char *szPublicKey,
                         char **pszJson,
                         tSID_Error *pError);

#ifdef __cplusplus
}
#endif

#endif
